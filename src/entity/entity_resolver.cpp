#include "cogmem/entity/entity_resolver.hpp"
#include "cogmem/core/errors.hpp"
#include "cogmem/core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

namespace cogmem {

EntityResolver::EntityResolver(MemoryStore& store, ResolverConfig config)
    : store_(store), config_(std::move(config)) {
    if (config_.aliases.empty()) {
        config_.aliases = {
            {"apple inc", "Apple"},
            {"apple inc.", "Apple"},
            {"苹果公司", "Apple"},
            {"google", "Google"},
            {"谷歌", "Google"},
            {"microsoft", "Microsoft"},
            {"微软", "Microsoft"}
        };
    }
}

// ============================================================================
// Name handling
// ============================================================================

std::string EntityResolver::normalize_mention(const std::string& mention) const {
    std::string name = collapse_whitespace(mention);
    if (name.empty()) return name;

    auto alias = config_.aliases.find(to_lower_ascii(name));
    if (alias != config_.aliases.end()) {
        return alias->second;
    }

    if (is_ascii(name)) {
        // Title-case each word: "new york" -> "New York"
        bool start = true;
        for (auto& c : name) {
            if (c == ' ' || c == '-') {
                start = true;
                continue;
            }
            c = static_cast<char>(start ? std::toupper(static_cast<unsigned char>(c))
                                        : std::tolower(static_cast<unsigned char>(c)));
            start = false;
        }
    }
    return name;
}

std::string EntityResolver::base_name(const std::string& canonical_name) {
    size_t hash = canonical_name.rfind('#');
    if (hash == std::string::npos || hash == 0) return canonical_name;
    std::string suffix = canonical_name.substr(hash + 1);
    bool numeric = !suffix.empty() && std::all_of(suffix.begin(), suffix.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    return numeric ? canonical_name.substr(0, hash) : canonical_name;
}

std::vector<Entity> EntityResolver::find_candidates(const std::string& user_id,
                                                    const std::string& normalized_name) const {
    std::vector<Entity> candidates;
    for (auto& entity : store_.list_entities(user_id)) {
        std::string base = base_name(entity.canonical_name);
        if (base == normalized_name ||
            jaro_winkler_similarity(base, normalized_name) >= config_.fuzzy_match_threshold) {
            candidates.push_back(std::move(entity));
        }
    }
    return candidates;
}

std::string EntityResolver::next_disjoint_name(const std::vector<Entity>& candidates,
                                               const std::string& name) const {
    int suffix = 2;
    while (true) {
        std::string candidate_name = name + "#" + std::to_string(suffix);
        bool taken = std::any_of(candidates.begin(), candidates.end(),
            [&](const Entity& e) { return e.canonical_name == candidate_name; });
        if (!taken) return candidate_name;
        ++suffix;
    }
}

// ============================================================================
// Scoring
// ============================================================================

double EntityResolver::context_score(const Entity& candidate,
                                     const std::set<std::string>& keywords,
                                     const TypeGuess& guess) const {
    double overlap = 0.0;
    if (!keywords.empty()) {
        size_t known = 0;
        for (const auto& keyword : keywords) {
            if (candidate.context_profile.count(keyword)) ++known;
        }
        overlap = static_cast<double>(known) / static_cast<double>(keywords.size());
    }

    double agreement;
    if (guess.type == entity_types::Unknown || candidate.entity_type == entity_types::Unknown) {
        agreement = 0.5;
    } else {
        agreement = guess.type == candidate.entity_type ? 1.0 : 0.0;
    }

    return 0.4 * overlap + 0.6 * agreement;
}

double EntityResolver::attribute_confidence(const AttributeValue& attr, Timestamp now, double decay_days) {
    if (attr.count <= 0 || attr.observations <= 0) return 0.0;
    double frequency = 1.0 - std::exp(-static_cast<double>(attr.count) / 2.0);
    double consistency = static_cast<double>(attr.count) / static_cast<double>(attr.observations);
    double age_days = std::max(0.0, days_between(attr.last_seen, now));
    double recency = std::exp(-age_days / decay_days);
    return std::clamp(attr.extraction_confidence * frequency * consistency * recency, 0.0, 1.0);
}

bool EntityResolver::merge_attribute(Entity& entity,
                                     const AttributeObservation& observation,
                                     Timestamp now,
                                     double decay_days) {
    auto it = entity.attributes.find(observation.key);
    if (it == entity.attributes.end()) {
        AttributeValue attr;
        attr.value = observation.value;
        attr.extraction_confidence = observation.confidence;
        attr.count = 1;
        attr.observations = 1;
        attr.first_seen = now;
        attr.last_seen = now;
        attr.confidence = attribute_confidence(attr, now, decay_days);
        entity.attributes[observation.key] = attr;
        return true;
    }

    AttributeValue& existing = it->second;
    existing.observations += 1;

    if (existing.value == observation.value) {
        existing.count += 1;
        existing.last_seen = now;
        existing.extraction_confidence = std::max(existing.extraction_confidence, observation.confidence);
        existing.confidence = attribute_confidence(existing, now, decay_days);
        return true;
    }

    AttributeValue challenger;
    challenger.value = observation.value;
    challenger.extraction_confidence = observation.confidence;
    challenger.count = 1;
    challenger.observations = existing.observations;
    challenger.first_seen = now;
    challenger.last_seen = now;
    challenger.confidence = attribute_confidence(challenger, now, decay_days);

    double incumbent = attribute_confidence(existing, now, decay_days);
    if (challenger.confidence > incumbent) {
        existing = challenger;
        return true;
    }

    existing.confidence = incumbent;
    return false;
}

// ============================================================================
// Resolution
// ============================================================================

Entity EntityResolver::create_entity(const std::string& user_id,
                                     const std::string& canonical_name,
                                     const TypeGuess& guess,
                                     Timestamp timestamp) const {
    Entity entity;
    entity.entity_id = generate_id("ent");
    entity.user_id = user_id;
    entity.canonical_name = canonical_name;
    entity.entity_type = guess.type;
    entity.type_confidence = guess.confidence;
    entity.first_seen = timestamp;
    entity.last_seen = timestamp;
    entity.mention_count = 0;
    return entity;
}

void EntityResolver::observe(Entity& entity,
                             const std::set<std::string>& keywords,
                             const TypeGuess& guess,
                             const std::string& context,
                             Timestamp timestamp) const {
    entity.mention_count += 1;
    entity.last_seen = std::max(entity.last_seen, timestamp);

    // Type is a derived, confidence-scored attribute: refine it gently
    if (guess.type != entity_types::Unknown) {
        if (entity.entity_type == entity_types::Unknown) {
            entity.entity_type = guess.type;
            entity.type_confidence = guess.confidence;
        } else if (entity.entity_type == guess.type) {
            entity.type_confidence = std::min(0.99, entity.type_confidence + 0.02);
        }
    }

    for (const auto& keyword : keywords) {
        entity.context_profile[keyword]++;
    }
    if (entity.context_profile.size() > config_.context_profile_limit) {
        std::vector<std::pair<std::string, int>> ranked(entity.context_profile.begin(),
                                                        entity.context_profile.end());
        std::stable_sort(ranked.begin(), ranked.end(),
            [](const auto& a, const auto& b) { return a.second > b.second; });
        ranked.resize(config_.context_profile_limit);
        entity.context_profile = std::map<std::string, int>(ranked.begin(), ranked.end());
    }

    for (const auto& observation : classifier_.extract_attributes(context)) {
        bool accepted = merge_attribute(entity, observation, timestamp, config_.attribute_decay_days);
        if (config_.verbose && !accepted) {
            std::cout << "  Discarded attribute " << observation.key << "=" << observation.value
                      << " for " << entity.canonical_name << std::endl;
        }
    }
}

Entity EntityResolver::resolve(const std::string& user_id,
                               const std::string& mention,
                               const std::string& context,
                               Timestamp timestamp) {
    std::string name = normalize_mention(mention);
    if (name.empty()) {
        throw ValidationError("entity mention is empty");
    }

    std::string full_context = context.empty() ? mention : context;
    std::set<std::string> keywords = context_keywords(full_context);
    for (const auto& own : context_keywords(mention)) {
        keywords.erase(own);
    }
    TypeGuess guess = classifier_.classify(full_context);

    std::vector<Entity> candidates = find_candidates(user_id, name);

    Entity chosen;
    bool is_new = false;

    if (candidates.empty()) {
        chosen = create_entity(user_id, name, guess, timestamp);
        is_new = true;
    } else if (candidates.size() == 1) {
        const Entity& only = candidates.front();
        bool type_clash = guess.type != entity_types::Unknown &&
                          only.entity_type != entity_types::Unknown &&
                          guess.type != only.entity_type &&
                          guess.confidence >= config_.type_conflict_confidence &&
                          only.type_confidence >= config_.type_conflict_confidence;
        if (type_clash) {
            chosen = create_entity(user_id, next_disjoint_name(candidates, name), guess, timestamp);
            is_new = true;
        } else {
            chosen = only;
        }
    } else {
        bool no_signal = keywords.empty() && guess.type == entity_types::Unknown;
        auto exact = std::find_if(candidates.begin(), candidates.end(),
            [&](const Entity& e) { return e.canonical_name == name; });

        if (no_signal && exact != candidates.end()) {
            chosen = *exact;
        } else {
            const Entity* best = nullptr;
            double best_score = -1.0;
            for (const auto& candidate : candidates) {
                double score = context_score(candidate, keywords, guess);
                if (score > best_score) {
                    best_score = score;
                    best = &candidate;
                }
            }

            if (best && best_score > config_.context_score_threshold) {
                chosen = *best;
            } else {
                chosen = create_entity(user_id, next_disjoint_name(candidates, name), guess, timestamp);
                is_new = true;
            }

            if (config_.verbose) {
                std::cout << "Disambiguated '" << name << "' among " << candidates.size()
                          << " candidates (best score " << best_score << ") -> "
                          << chosen.canonical_name << std::endl;
            }
        }
    }

    observe(chosen, keywords, guess, full_context, timestamp);

    if (is_new) {
        store_.insert_entity(chosen);
    } else {
        store_.update_entity(chosen);
    }
    return chosen;
}

} // namespace cogmem
