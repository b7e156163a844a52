#pragma once

#include "cogmem/core/time_utils.hpp"
#include "cogmem/extraction/inference_provider.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cogmem {

/**
 * @brief Resolves Chinese relative time expressions against a reference time
 *
 * Understands 今天/昨天/前天/N天前, 凌晨/早上/上午/中午/下午/晚上 and "N点".
 */
class TimeHintParser {
public:
    /**
     * @return Resolved timestamp, or nullopt when the text carries no time expression
     */
    static std::optional<Timestamp> resolve(const std::string& text, Timestamp reference);
};

/**
 * @brief Deterministic keyword extractor used when inference is unavailable
 *
 * Scans for a known verb, then an optional number and measure word, and takes
 * the following noun phrase as the target. A negation governing the verb
 * (不/没/没有/别, possibly through modal words such as 想 or 喜欢) is folded
 * into the action, so "没喝咖啡" and "不喜欢喝咖啡" yield "没喝" and "不喝".
 */
class RuleExtractor {
public:
    static constexpr double kQuantifiedConfidence = 0.85;   ///< verb + number + unit
    static constexpr double kNumberOnlyConfidence = 0.75;   ///< verb + number
    static constexpr double kPlainConfidence = 0.6;         ///< verb + target

    RuleExtractor();

    std::vector<CandidateEvent> extract(const std::string& text, Timestamp reference) const;

    /**
     * @brief Parse Arabic or Chinese numerals ("3", "2.5", "十二", "两", "半")
     */
    static std::optional<double> parse_number(const std::string& text);

    void add_verb(const std::string& surface, const std::string& action, bool intransitive = false);
    void add_unit(const std::string& unit);

private:
    struct VerbEntry {
        std::string action;
        bool intransitive = false;
    };

    std::map<std::string, VerbEntry> verbs_;   ///< Surface form -> normalized action
    std::vector<std::string> units_;           ///< Sorted longest first
    size_t max_verb_chars_ = 1;
};

} // namespace cogmem
