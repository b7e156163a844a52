#include "cogmem/extraction/rule_extractor.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <set>

namespace cogmem {

namespace {

const std::map<std::string, int>& cjk_digits() {
    static const std::map<std::string, int> digits = {
        {"零", 0}, {"一", 1}, {"二", 2}, {"两", 2}, {"三", 3}, {"四", 4},
        {"五", 5}, {"六", 6}, {"七", 7}, {"八", 8}, {"九", 9}
    };
    return digits;
}

bool is_numeral_char(const std::string& ch) {
    if (ch.size() == 1) {
        return (ch[0] >= '0' && ch[0] <= '9') || ch[0] == '.';
    }
    return cjk_digits().count(ch) || ch == "十" || ch == "百" || ch == "半";
}

bool is_stop_char(const std::string& ch) {
    static const std::set<std::string> stops = {
        "，", "。", "！", "？", "、", "；", "：", ",", ".", "!", "?", ";", ":", " ",
        "\t", "\n", "和", "跟", "还", "又", "了", "吧", "呢", "啊", "呀", "嘛"
    };
    return stops.count(ch) > 0;
}

bool is_aspect_particle(const std::string& ch) {
    return ch == "了" || ch == "过" || ch == "着" || ch == "完";
}

std::string join(const std::vector<std::string>& chars, size_t from, size_t to) {
    std::string result;
    for (size_t i = from; i < to && i < chars.size(); ++i) {
        result += chars[i];
    }
    return result;
}

// Numeral run immediately before position `end` (exclusive)
std::string numeral_before(const std::vector<std::string>& chars, size_t end) {
    size_t start = end;
    while (start > 0 && is_numeral_char(chars[start - 1])) {
        --start;
    }
    return join(chars, start, end);
}

// Modal and stance words that may sit between a negation and its verb,
// as in "不喜欢喝" or "再也不想喝"
const std::vector<std::string>& stance_words() {
    static const std::vector<std::string> words = {
        "喜欢", "愿意", "打算", "需要", "应该", "可以", "想要",
        "想", "要", "再", "也", "会", "能", "敢", "肯", "爱", "太", "都"
    };
    return words;
}

// Negation governing the verb at `verb_pos`, scanning back to the clause start
std::string negation_before(const std::vector<std::string>& chars, size_t verb_pos) {
    size_t k = verb_pos;
    while (k > 0) {
        if (k >= 2 && chars[k - 2] == "没" && chars[k - 1] == "有") return "没";
        if (chars[k - 1] == "不" || chars[k - 1] == "没" || chars[k - 1] == "别") return chars[k - 1];
        if (is_stop_char(chars[k - 1])) return "";

        size_t skipped = 0;
        for (const auto& word : stance_words()) {
            size_t len = utf8_length(word);
            if (len <= k && join(chars, k - len, k) == word) {
                skipped = len;
                break;
            }
        }
        if (skipped == 0) return "";
        k -= skipped;
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// TimeHintParser
// ============================================================================

std::optional<Timestamp> TimeHintParser::resolve(const std::string& text, Timestamp reference) {
    auto chars = utf8_chars(text);
    bool found_day = false;
    int offset_days = 0;

    size_t days_ago = text.find("天前");
    if (days_ago != std::string::npos) {
        // Locate "天前" in code-point space to read the preceding numeral
        for (size_t i = 0; i + 1 < chars.size(); ++i) {
            if (chars[i] == "天" && chars[i + 1] == "前") {
                auto n = RuleExtractor::parse_number(numeral_before(chars, i));
                if (n && *n > 0) {
                    offset_days = -static_cast<int>(*n);
                    found_day = true;
                }
                break;
            }
        }
    }
    if (!found_day) {
        if (contains(text, "前天")) {
            offset_days = -2;
            found_day = true;
        } else if (contains(text, "昨天") || contains(text, "昨晚")) {
            offset_days = -1;
            found_day = true;
        } else if (contains(text, "今天") || contains(text, "今早") || contains(text, "今晚")) {
            found_day = true;
        }
    }

    std::optional<int> hour;
    int minute = 0;
    if (contains(text, "凌晨")) hour = 3;
    else if (contains(text, "早上") || contains(text, "早晨") || contains(text, "上午") ||
             contains(text, "今早")) hour = 9;
    else if (contains(text, "中午")) hour = 12;
    else if (contains(text, "下午")) hour = 14;
    else if (contains(text, "傍晚")) hour = 18;
    else if (contains(text, "晚上") || contains(text, "今晚") || contains(text, "昨晚")) hour = 20;

    // Explicit clock time overrides the part-of-day default
    for (size_t i = 1; i < chars.size(); ++i) {
        if (chars[i] != "点") continue;
        std::string numeral = numeral_before(chars, i);
        bool clock_suffix = i + 1 < chars.size() && (chars[i + 1] == "钟" || chars[i + 1] == "半");
        if (numeral == "一" && !clock_suffix) continue;  // "一点" = "a little"
        auto n = RuleExtractor::parse_number(numeral);
        if (!n || *n < 0 || *n > 24) continue;
        int h = static_cast<int>(*n);
        bool afternoon = contains(text, "下午") || contains(text, "晚上") ||
                         contains(text, "傍晚") || contains(text, "今晚");
        if (afternoon && h < 12) h += 12;
        hour = h % 24;
        if (i + 1 < chars.size() && chars[i + 1] == "半") minute = 30;
        break;
    }

    if (!found_day && !hour) {
        return std::nullopt;
    }

    if (!hour) {
        return reference + days(offset_days);
    }
    return start_of_day(reference) + days(offset_days) + hours(*hour) + minute * 60;
}

// ============================================================================
// RuleExtractor
// ============================================================================

RuleExtractor::RuleExtractor() {
    const std::vector<std::pair<std::string, std::string>> transitive = {
        {"吃", "吃"}, {"喝", "喝"}, {"买", "购买"}, {"购买", "购买"}, {"去", "去"},
        {"做", "做"}, {"看", "看"}, {"读", "阅读"}, {"阅读", "阅读"}, {"写", "写"},
        {"听", "听"}, {"玩", "玩"}, {"学习", "学习"}, {"消费", "消费"}, {"支付", "支付"},
        {"戒", "戒"}, {"抽", "抽"}, {"骑", "骑"}, {"煮", "煮"}
    };
    for (const auto& [surface, action] : transitive) {
        add_verb(surface, action);
    }

    const std::vector<std::string> intransitive = {
        "运动", "跑步", "游泳", "散步", "睡觉", "起床", "工作", "健身", "冥想"
    };
    for (const auto& verb : intransitive) {
        add_verb(verb, verb, true);
    }

    const std::vector<std::string> units = {
        "个", "只", "件", "台", "本", "张", "次", "杯", "瓶", "碗", "份", "顿", "包", "盒",
        "片", "块", "分钟", "小时", "天", "周", "月", "年", "公斤", "千克", "克", "斤",
        "毫升", "升", "米", "公里", "千米", "元", "页", "首", "部", "集"
    };
    for (const auto& unit : units) {
        add_unit(unit);
    }
}

void RuleExtractor::add_verb(const std::string& surface, const std::string& action, bool intransitive) {
    verbs_[surface] = VerbEntry{action, intransitive};
    max_verb_chars_ = std::max(max_verb_chars_, utf8_length(surface));
}

void RuleExtractor::add_unit(const std::string& unit) {
    units_.push_back(unit);
    std::stable_sort(units_.begin(), units_.end(), [](const std::string& a, const std::string& b) {
        return utf8_length(a) > utf8_length(b);
    });
}

std::optional<double> RuleExtractor::parse_number(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) return std::nullopt;

    if (is_ascii(t)) {
        bool valid = std::all_of(t.begin(), t.end(), [](char c) {
            return (c >= '0' && c <= '9') || c == '.';
        });
        if (!valid || t.front() == '.' || std::count(t.begin(), t.end(), '.') > 1) {
            return std::nullopt;
        }
        return std::stod(t);
    }

    if (t == "半") return 0.5;

    double total = 0.0;
    int current = 0;
    bool any = false;
    for (const auto& ch : utf8_chars(t)) {
        auto it = cjk_digits().find(ch);
        if (it != cjk_digits().end()) {
            current = it->second;
            any = true;
        } else if (ch == "十") {
            total += (current == 0 ? 1 : current) * 10;
            current = 0;
            any = true;
        } else if (ch == "百") {
            total += (current == 0 ? 1 : current) * 100;
            current = 0;
            any = true;
        } else if (ch == "半") {
            total += current + 0.5;
            current = 0;
            any = true;
        } else {
            return std::nullopt;
        }
    }
    if (!any) return std::nullopt;
    return total + current;
}

std::vector<CandidateEvent> RuleExtractor::extract(const std::string& text, Timestamp reference) const {
    std::vector<CandidateEvent> candidates;
    auto chars = utf8_chars(text);
    const size_t n = chars.size();

    std::string timestamp_hint;
    if (auto ts = TimeHintParser::resolve(text, reference)) {
        timestamp_hint = to_iso8601(*ts);
    }

    auto match_verb = [&](size_t pos) -> std::pair<size_t, const VerbEntry*> {
        size_t max_len = std::min(max_verb_chars_, n - pos);
        for (size_t len = max_len; len >= 1; --len) {
            auto it = verbs_.find(join(chars, pos, pos + len));
            if (it != verbs_.end()) return {len, &it->second};
        }
        return {0, nullptr};
    };

    size_t i = 0;
    while (i < n) {
        auto [verb_len, entry] = match_verb(i);
        if (!entry) {
            ++i;
            continue;
        }

        std::string prefix = negation_before(chars, i);

        size_t j = i + verb_len;
        while (j < n && is_aspect_particle(chars[j])) ++j;

        CandidateEvent candidate;
        candidate.action = prefix + entry->action;
        candidate.extractor = "rule";
        candidate.timestamp_hint = timestamp_hint;

        size_t num_end = j;
        while (num_end < n && is_numeral_char(chars[num_end])) ++num_end;
        if (num_end > j) {
            auto quantity = parse_number(join(chars, j, num_end));
            if (quantity) {
                candidate.quantity = *quantity;
                j = num_end;
                for (const auto& unit : units_) {
                    size_t ulen = utf8_length(unit);
                    if (join(chars, j, j + ulen) == unit) {
                        candidate.unit = unit;
                        j += ulen;
                        break;
                    }
                }
            }
        }

        size_t target_start = j;
        while (j < n && !is_stop_char(chars[j])) {
            if (j > target_start && match_verb(j).second) break;
            ++j;
        }
        candidate.target = trim(join(chars, target_start, j));

        if (candidate.target.empty()) {
            if (!entry->intransitive) {
                i += verb_len;
                continue;
            }
            candidate.target = entry->action;
        }

        if (candidate.quantity && candidate.unit) {
            candidate.confidence = kQuantifiedConfidence;
        } else if (candidate.quantity) {
            candidate.confidence = kNumberOnlyConfidence;
        } else {
            candidate.confidence = kPlainConfidence;
        }

        candidates.push_back(std::move(candidate));
        i = std::max(j, i + verb_len);
    }

    return candidates;
}

} // namespace cogmem
