#pragma once

#include <map>
#include <string>
#include <vector>

namespace cogmem {

/**
 * @brief Type guess for a mention from its surrounding words
 */
struct TypeGuess {
    std::string type;                      ///< One of entity_types
    double confidence = 0.0;
    int keyword_hits = 0;
};

/**
 * @brief Attribute value read from a mention's context
 */
struct AttributeObservation {
    std::string key;                       ///< "color", "taste", "texture", "size", "price"
    std::string value;
    double confidence = 0.0;               ///< Strength of the extraction heuristic
};

/**
 * @brief Bounded keyword heuristics for entity typing and attribute reading
 *
 * Eat/drink contexts bias toward food, stock/invest toward organization, and
 * so on. This is deliberately not an NLP pipeline.
 */
class ContextClassifier {
public:
    ContextClassifier();

    TypeGuess classify(const std::string& context) const;

    std::vector<AttributeObservation> extract_attributes(const std::string& context) const;

    void add_keyword(const std::string& type, const std::string& keyword);

private:
    std::map<std::string, std::vector<std::string>> type_keywords_;
    std::vector<AttributeObservation> attribute_lexicon_;
};

} // namespace cogmem
