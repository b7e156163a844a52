#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace cogmem {

std::vector<std::string> utf8_chars(const std::string& text) {
    std::vector<std::string> chars;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) len = text.size() - i;
        chars.push_back(text.substr(i, len));
        i += len;
    }
    return chars;
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

std::string collapse_whitespace(const std::string& text) {
    std::string result;
    bool in_space = false;
    for (char c : trim(text)) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (!in_space) result += ' ';
            in_space = true;
        } else {
            result += c;
            in_space = false;
        }
    }
    return result;
}

std::string to_lower_ascii(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_ascii(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

bool contains(const std::string& haystack, const std::string& needle) {
    return !needle.empty() && haystack.find(needle) != std::string::npos;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string erase_all(std::string text, const std::string& needle) {
    if (needle.empty()) return text;
    size_t pos;
    while ((pos = text.find(needle)) != std::string::npos) {
        text.erase(pos, needle.size());
    }
    return text;
}

std::set<std::string> context_keywords(const std::string& text) {
    std::set<std::string> keywords;
    std::string word;
    std::vector<std::string> cjk_run;

    auto flush_word = [&]() {
        if (word.size() >= 2) keywords.insert(to_lower_ascii(word));
        word.clear();
    };
    auto flush_cjk = [&]() {
        if (cjk_run.size() == 1) {
            keywords.insert(cjk_run[0]);
        }
        for (size_t i = 0; i + 1 < cjk_run.size(); ++i) {
            keywords.insert(cjk_run[i] + cjk_run[i + 1]);
        }
        cjk_run.clear();
    };

    for (const auto& ch : utf8_chars(text)) {
        if (ch.size() == 1) {
            flush_cjk();
            if (std::isalnum(static_cast<unsigned char>(ch[0]))) {
                word += ch;
            } else {
                flush_word();
            }
        } else {
            flush_word();
            // Skip common CJK punctuation (U+3000 block and fullwidth forms)
            if (ch == "，" || ch == "。" || ch == "！" || ch == "？" || ch == "、" ||
                ch == "；" || ch == "：" || ch == "　") {
                flush_cjk();
            } else {
                cjk_run.push_back(ch);
            }
        }
    }
    flush_word();
    flush_cjk();
    return keywords;
}

double jaccard_similarity(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;
    size_t intersection = 0;
    for (const auto& item : a) {
        if (b.count(item)) ++intersection;
    }
    size_t union_size = a.size() + b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

double jaro_winkler_similarity(const std::string& a, const std::string& b) {
    auto s1 = utf8_chars(a);
    auto s2 = utf8_chars(b);
    if (s1.empty() && s2.empty()) return 1.0;
    if (s1.empty() || s2.empty()) return 0.0;

    int len1 = static_cast<int>(s1.size());
    int len2 = static_cast<int>(s2.size());
    int match_distance = std::max(0, std::max(len1, len2) / 2 - 1);

    std::vector<bool> matched1(s1.size(), false);
    std::vector<bool> matched2(s2.size(), false);
    int matches = 0;

    for (int i = 0; i < len1; ++i) {
        int start = std::max(0, i - match_distance);
        int end = std::min(i + match_distance + 1, len2);
        for (int j = start; j < end; ++j) {
            if (matched2[j] || s1[i] != s2[j]) continue;
            matched1[i] = matched2[j] = true;
            ++matches;
            break;
        }
    }
    if (matches == 0) return 0.0;

    int transpositions = 0;
    int k = 0;
    for (int i = 0; i < len1; ++i) {
        if (!matched1[i]) continue;
        while (!matched2[k]) ++k;
        if (s1[i] != s2[k]) ++transpositions;
        ++k;
    }

    double m = matches;
    double jaro = (m / len1 + m / len2 + (m - transpositions / 2.0) / m) / 3.0;

    int prefix = 0;
    for (int i = 0; i < std::min({len1, len2, 4}); ++i) {
        if (s1[i] != s2[i]) break;
        ++prefix;
    }
    return jaro + prefix * 0.1 * (1.0 - jaro);
}

std::string generate_id(const std::string& prefix) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist;

    std::ostringstream oss;
    oss << prefix << "_" << std::hex << std::setfill('0')
        << std::setw(16) << dist(rng);
    return oss.str();
}

} // namespace cogmem
