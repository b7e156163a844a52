#include "cogmem/entity/context_classifier.hpp"
#include "cogmem/core/text_utils.hpp"
#include "cogmem/entity/entity.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace cogmem {

ContextClassifier::ContextClassifier() {
    type_keywords_[entity_types::Food] = {
        "吃", "喝", "水果", "食物", "饭", "菜", "好吃", "味道", "早餐", "午餐", "晚餐",
        "eat", "drink", "food", "taste", "breakfast", "lunch", "dinner"
    };
    type_keywords_[entity_types::Organization] = {
        "股票", "公司", "投资", "企业", "机构", "股价", "上市", "财报", "发布会",
        "stock", "invest", "company", "shares", "earnings"
    };
    type_keywords_[entity_types::Person] = {
        "朋友", "同事", "先生", "女士", "医生", "老师", "妈妈", "爸爸", "见面", "聊天",
        "friend", "colleague", "met", "mom", "dad"
    };
    type_keywords_[entity_types::Place] = {
        "去", "到", "地方", "城市", "国家", "旅游", "住在", "出差",
        "city", "travel", "visit", "trip"
    };
    type_keywords_[entity_types::Concept] = {
        "想法", "概念", "理论", "观点", "原则",
        "idea", "theory", "concept", "principle"
    };
    type_keywords_[entity_types::Object] = {
        "买", "用", "手机", "电脑", "工具", "设备",
        "bought", "use", "device", "tool"
    };

    attribute_lexicon_ = {
        {"color", "红色", 0.8}, {"color", "绿色", 0.8}, {"color", "黄色", 0.8},
        {"color", "蓝色", 0.8}, {"color", "白色", 0.8}, {"color", "黑色", 0.8},
        {"color", "紫色", 0.8}, {"color", "橙色", 0.8},
        {"color", "red", 0.8}, {"color", "green", 0.8}, {"color", "yellow", 0.8},
        {"taste", "甜", 0.7}, {"taste", "酸", 0.7}, {"taste", "苦", 0.7},
        {"taste", "辣", 0.7}, {"taste", "咸", 0.7},
        {"taste", "sweet", 0.7}, {"taste", "sour", 0.7}, {"taste", "bitter", 0.7},
        {"texture", "脆", 0.6}, {"texture", "软", 0.6}, {"texture", "硬", 0.6},
        {"size", "很大", 0.6}, {"size", "很小", 0.6}
    };
}

void ContextClassifier::add_keyword(const std::string& type, const std::string& keyword) {
    type_keywords_[type].push_back(keyword);
}

TypeGuess ContextClassifier::classify(const std::string& context) const {
    std::string lowered = to_lower_ascii(context);

    std::map<std::string, int> hits;
    for (const auto& [type, keywords] : type_keywords_) {
        for (const auto& keyword : keywords) {
            if (contains(lowered, keyword)) {
                hits[type]++;
            }
        }
    }

    TypeGuess guess{entity_types::Unknown, 0.2, 0};
    int runner_up = 0;
    for (const auto& [type, count] : hits) {
        if (count > guess.keyword_hits) {
            runner_up = guess.keyword_hits;
            guess.type = type;
            guess.keyword_hits = count;
        } else if (count > runner_up) {
            runner_up = count;
        }
    }

    if (guess.keyword_hits == 0) {
        return guess;
    }
    if (guess.keyword_hits == runner_up) {
        // Tied evidence: keep the first type but flag it as weak
        guess.confidence = 0.4;
        return guess;
    }

    int margin = guess.keyword_hits - runner_up;
    guess.confidence = std::min(0.95, 0.55 + 0.15 * margin);
    return guess;
}

std::vector<AttributeObservation> ContextClassifier::extract_attributes(const std::string& context) const {
    std::vector<AttributeObservation> observations;
    std::set<std::string> seen_keys;
    std::string lowered = to_lower_ascii(context);

    for (const auto& entry : attribute_lexicon_) {
        if (seen_keys.count(entry.key)) continue;
        if (contains(lowered, entry.value)) {
            observations.push_back(entry);
            seen_keys.insert(entry.key);
        }
    }

    // Price: "<number>元" or "<number>块"
    auto chars = utf8_chars(context);
    for (size_t i = 1; i < chars.size() && !seen_keys.count("price"); ++i) {
        if (chars[i] != "元" && chars[i] != "块") continue;
        size_t start = i;
        while (start > 0 && chars[start - 1].size() == 1 &&
               (std::isdigit(static_cast<unsigned char>(chars[start - 1][0])) || chars[start - 1] == ".")) {
            --start;
        }
        if (start == i) continue;
        std::string number;
        for (size_t k = start; k < i; ++k) number += chars[k];
        observations.push_back({"price", number + "元", 0.7});
        seen_keys.insert("price");
    }

    return observations;
}

} // namespace cogmem
