#include "cogmem/cognitive/conflict_detector.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace cogmem {

// ============================================================================
// Lexicon
// ============================================================================

nlohmann::json CategoryRule::to_json() const {
    return {{"names", names}, {"incompatible", incompatible}};
}

CategoryRule CategoryRule::from_json(const nlohmann::json& j) {
    CategoryRule rule;
    rule.names = j.value("names", std::vector<std::string>{});
    rule.incompatible = j.value("incompatible", std::vector<std::string>{});
    return rule;
}

ConflictLexicon ConflictLexicon::defaults() {
    ConflictLexicon lexicon;
    lexicon.antonyms = {
        {"喜欢", "不喜欢"},
        {"喜欢", "讨厌"},
        {"爱", "恨"},
        {"经常", "很少"},
        {"总是", "从不"},
        {"每天", "从不"},
        {"是", "不是"},
        {"likes", "dislikes"},
        {"always", "never"},
        {"often", "rarely"}
    };
    lexicon.categories = {
        {{"素食主义者", "素食", "vegetarian"}, {"肉", "牛排", "猪肉", "鸡肉", "meat", "steak"}},
        {{"早起", "early riser"}, {"夜猫子", "熬夜", "night owl"}},
        {{"内向", "introvert"}, {"外向", "extrovert"}}
    };
    lexicon.negations = {"不", "从不", "没", "never", "not", "don't", "doesn't"};
    lexicon.filler = {"用户", "的", "user", "the"};
    return lexicon;
}

nlohmann::json ConflictLexicon::to_json() const {
    nlohmann::json pairs = nlohmann::json::array();
    for (const auto& [positive, negative] : antonyms) {
        pairs.push_back({positive, negative});
    }
    nlohmann::json cats = nlohmann::json::array();
    for (const auto& rule : categories) {
        cats.push_back(rule.to_json());
    }
    return {
        {"antonyms", pairs},
        {"categories", cats},
        {"negations", negations},
        {"filler", filler}
    };
}

ConflictLexicon ConflictLexicon::from_json(const nlohmann::json& j) {
    ConflictLexicon lexicon = defaults();
    if (j.contains("antonyms")) {
        lexicon.antonyms.clear();
        for (const auto& pair : j["antonyms"]) {
            if (!pair.is_array() || pair.size() != 2) {
                throw std::runtime_error("Antonym entries must be [positive, negative] pairs");
            }
            lexicon.antonyms.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
        }
    }
    if (j.contains("categories")) {
        lexicon.categories.clear();
        for (const auto& rule : j["categories"]) {
            lexicon.categories.push_back(CategoryRule::from_json(rule));
        }
    }
    if (j.contains("negations")) {
        lexicon.negations = j["negations"].get<std::vector<std::string>>();
    }
    if (j.contains("filler")) {
        lexicon.filler = j["filler"].get<std::vector<std::string>>();
    }
    return lexicon;
}

ConflictLexicon ConflictLexicon::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open conflict lexicon: " + path);
    }
    try {
        nlohmann::json j;
        file >> j;
        return from_json(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid conflict lexicon " + path + ": " + e.what());
    }
}

nlohmann::json ViewConflict::to_json() const {
    return {{"view_a", view_a}, {"view_b", view_b}, {"kind", kind}, {"reason", reason}};
}

// ============================================================================
// Detection
// ============================================================================

ConflictDetector::ConflictDetector(ConflictLexicon lexicon) : lexicon_(std::move(lexicon)) {}

std::string ConflictDetector::strip_filler(std::string text) const {
    for (const auto& word : lexicon_.filler) {
        text = erase_all(text, word);
    }
    return collapse_whitespace(text);
}

std::vector<ConflictDetector::Polarity> ConflictDetector::polarities(const std::string& hypothesis) const {
    std::string text = to_lower_ascii(hypothesis);
    std::vector<Polarity> result;

    // Negative first: "不喜欢" must not read as "喜欢" under any pair
    std::string without_negatives = text;
    for (const auto& pair : lexicon_.antonyms) {
        without_negatives = erase_all(without_negatives, pair.second);
    }

    for (size_t i = 0; i < lexicon_.antonyms.size(); ++i) {
        const auto& [positive, negative] = lexicon_.antonyms[i];
        Polarity p;
        p.pair_index = static_cast<int>(i);
        if (contains(text, negative)) {
            p.negative = true;
            p.remainder = strip_filler(erase_all(text, negative));
        } else if (contains(without_negatives, positive)) {
            p.negative = false;
            p.remainder = strip_filler(erase_all(text, positive));
        } else {
            continue;
        }
        result.push_back(std::move(p));
    }
    return result;
}

bool ConflictDetector::negated_before(const std::string& hypothesis, size_t pos) const {
    std::string before = hypothesis.substr(0, pos);
    for (const auto& negation : lexicon_.negations) {
        if (negation.empty()) continue;
        size_t at = before.rfind(negation);
        if (at == std::string::npos) continue;
        // ASCII negations must stand alone as words
        if (is_ascii(negation)) {
            bool left_ok = at == 0 || before[at - 1] == ' ';
            size_t end = at + negation.size();
            bool right_ok = end >= before.size() || before[end] == ' ';
            if (!left_ok || !right_ok) continue;
        }
        return true;
    }
    return false;
}

bool ConflictDetector::asserts_category(const std::string& hypothesis, const CategoryRule& rule) const {
    std::string text = to_lower_ascii(hypothesis);
    for (const auto& name : rule.names) {
        size_t pos = text.find(to_lower_ascii(name));
        if (pos != std::string::npos && !negated_before(text, pos)) {
            return true;
        }
    }
    return false;
}

bool ConflictDetector::asserts_member(const std::string& hypothesis, const CategoryRule& rule,
                                      std::string& member) const {
    std::string text = to_lower_ascii(hypothesis);
    for (const auto& candidate : rule.incompatible) {
        size_t pos = text.find(to_lower_ascii(candidate));
        if (pos != std::string::npos && !negated_before(text, pos)) {
            member = candidate;
            return true;
        }
    }
    return false;
}

bool ConflictDetector::conflicts(const DerivedView& a, const DerivedView& b, ViewConflict* out) const {
    if (a.view_id == b.view_id || a.user_id != b.user_id) return false;

    // Scoped claims ("周末" vs "工作日") can both hold
    if (!a.context_tag.empty() && !b.context_tag.empty() && a.context_tag != b.context_tag) {
        return false;
    }

    auto pa = polarities(a.hypothesis);
    auto pb = polarities(b.hypothesis);
    for (const auto& x : pa) {
        for (const auto& y : pb) {
            if (x.pair_index != y.pair_index || x.negative == y.negative) continue;
            if (x.remainder.empty() || y.remainder.empty()) continue;
            bool same_subject = x.remainder == y.remainder ||
                                contains(x.remainder, y.remainder) ||
                                contains(y.remainder, x.remainder);
            if (!same_subject) continue;

            if (out) {
                const auto& pair = lexicon_.antonyms[x.pair_index];
                out->view_a = a.view_id;
                out->view_b = b.view_id;
                out->kind = "antonym";
                out->reason = "'" + pair.first + "' vs '" + pair.second + "' about '" +
                              (x.remainder.size() <= y.remainder.size() ? x.remainder : y.remainder) + "'";
            }
            return true;
        }
    }

    for (const auto& rule : lexicon_.categories) {
        std::string member;
        bool hit = (asserts_category(a.hypothesis, rule) && asserts_member(b.hypothesis, rule, member)) ||
                   (asserts_category(b.hypothesis, rule) && asserts_member(a.hypothesis, rule, member));
        if (!hit) continue;

        if (out) {
            out->view_a = a.view_id;
            out->view_b = b.view_id;
            out->kind = "category";
            out->reason = "'" + rule.names.front() + "' is incompatible with '" + member + "'";
        }
        return true;
    }

    return false;
}

std::vector<ViewConflict> ConflictDetector::find_conflicts(const std::vector<DerivedView>& views) const {
    std::vector<ViewConflict> result;
    for (size_t i = 0; i < views.size(); ++i) {
        if (views[i].status != ViewStatus::Active) continue;
        for (size_t j = i + 1; j < views.size(); ++j) {
            if (views[j].status != ViewStatus::Active) continue;
            ViewConflict conflict;
            if (conflicts(views[i], views[j], &conflict)) {
                result.push_back(std::move(conflict));
            }
        }
    }
    return result;
}

std::vector<std::string> ConflictDetector::conflicts_for(const std::vector<ViewConflict>& conflicts,
                                                         const std::string& view_id) {
    std::vector<std::string> ids;
    for (const auto& c : conflicts) {
        if (c.view_a == view_id) ids.push_back(c.view_b);
        else if (c.view_b == view_id) ids.push_back(c.view_a);
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}

} // namespace cogmem
