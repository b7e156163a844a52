#pragma once

#include <set>
#include <string>
#include <vector>

namespace cogmem {

// ============================================================================
// Text helpers (UTF-8 aware, no external NLP)
// ============================================================================

/**
 * @brief Split a UTF-8 string into code points, each kept as its own byte string
 */
std::vector<std::string> utf8_chars(const std::string& text);

size_t utf8_length(const std::string& text);

std::string trim(const std::string& text);

/**
 * @brief Trim and collapse runs of ASCII whitespace to one space
 */
std::string collapse_whitespace(const std::string& text);

std::string to_lower_ascii(const std::string& text);

bool is_ascii(const std::string& text);

bool contains(const std::string& haystack, const std::string& needle);

bool starts_with(const std::string& text, const std::string& prefix);

/**
 * @brief Remove every occurrence of needle from text
 */
std::string erase_all(std::string text, const std::string& needle);

/**
 * @brief Context keywords: lowercase ASCII words plus CJK character bigrams
 */
std::set<std::string> context_keywords(const std::string& text);

/**
 * @brief Jaccard similarity of two keyword sets (0 when both empty)
 */
double jaccard_similarity(const std::set<std::string>& a, const std::set<std::string>& b);

/**
 * @brief Jaro-Winkler similarity computed over code points
 */
double jaro_winkler_similarity(const std::string& a, const std::string& b);

/**
 * @brief Random identifier with a readable prefix ("evt_3f9a...")
 */
std::string generate_id(const std::string& prefix);

} // namespace cogmem
