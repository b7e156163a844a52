#pragma once

#include "cogmem/cognitive/derived_view.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace cogmem {

// ============================================================================
// Conflict Lexicon
// ============================================================================

/**
 * @brief A category and the members that contradict it ("素食主义者" vs "肉")
 */
struct CategoryRule {
    std::vector<std::string> names;         ///< Surface forms of the category
    std::vector<std::string> incompatible;  ///< Members that contradict it

    nlohmann::json to_json() const;
    static CategoryRule from_json(const nlohmann::json& j);
};

/**
 * @brief Curated word lists behind conflict detection, loadable per locale
 */
struct ConflictLexicon {
    std::vector<std::pair<std::string, std::string>> antonyms;  ///< (positive, negative)
    std::vector<CategoryRule> categories;
    std::vector<std::string> negations;     ///< Words that negate a following member
    std::vector<std::string> filler;        ///< Stripped before comparing remainders

    /**
     * @brief Built-in Chinese and English lexicon
     */
    static ConflictLexicon defaults();

    /**
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static ConflictLexicon from_json_file(const std::string& path);

    nlohmann::json to_json() const;
    static ConflictLexicon from_json(const nlohmann::json& j);
};

// ============================================================================
// Conflict Detector
// ============================================================================

/**
 * @brief A pair of Active views that cannot both hold
 */
struct ViewConflict {
    std::string view_a;
    std::string view_b;
    std::string kind;                       ///< "antonym" or "category"
    std::string reason;

    nlohmann::json to_json() const;
};

/**
 * @brief Pairwise, purely programmatic contradiction check over Active views
 *
 * Two kinds are recognised: antonym pairs about the same remainder
 * ("喜欢吃辣" vs "不喜欢吃辣") and incompatible category membership
 * ("素食主义者" vs "喜欢吃肉"). Views carrying different non-empty context
 * tags never conflict.
 */
class ConflictDetector {
public:
    explicit ConflictDetector(ConflictLexicon lexicon = ConflictLexicon::defaults());

    std::vector<ViewConflict> find_conflicts(const std::vector<DerivedView>& views) const;

    /**
     * @brief Check one pair, regardless of status
     */
    bool conflicts(const DerivedView& a, const DerivedView& b, ViewConflict* out = nullptr) const;

    /**
     * @brief Ids of the views a given view conflicts with
     */
    static std::vector<std::string> conflicts_for(const std::vector<ViewConflict>& conflicts,
                                                  const std::string& view_id);

    const ConflictLexicon& lexicon() const { return lexicon_; }

private:
    ConflictLexicon lexicon_;

    struct Polarity {
        int pair_index = -1;
        bool negative = false;
        std::string remainder;
    };

    std::vector<Polarity> polarities(const std::string& hypothesis) const;
    std::string strip_filler(std::string text) const;
    bool asserts_category(const std::string& hypothesis, const CategoryRule& rule) const;
    bool asserts_member(const std::string& hypothesis, const CategoryRule& rule, std::string& member) const;
    bool negated_before(const std::string& hypothesis, size_t pos) const;
};

} // namespace cogmem
