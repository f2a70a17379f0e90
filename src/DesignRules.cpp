/**
 * @file DesignRules.cpp
 * @brief Implementation of design rule validation
 */

#include "boardmerge/DesignRules.hpp"
#include "boardmerge/Errors.hpp"

#include <set>

namespace boardmerge {

std::vector<std::string> differing_parameters(const DesignRuleSet& existing,
                                              const DesignRuleSet& incoming) {
    std::set<std::string> diffs;
    if (existing.name != incoming.name) diffs.insert("name");
    if (existing.description != incoming.description) diffs.insert("description");

    for (const auto& [key, value] : existing.params) {
        auto it = incoming.params.find(key);
        if (it == incoming.params.end() || it->second != value) {
            diffs.insert(key);
        }
    }
    for (const auto& [key, value] : incoming.params) {
        if (existing.params.count(key) == 0) {
            diffs.insert(key);
        }
    }
    for (const auto& [key, value] : existing.extensions) {
        auto it = incoming.extensions.find(key);
        if (it == incoming.extensions.end() || it->second != value) {
            diffs.insert(key);
        }
    }
    for (const auto& [key, value] : incoming.extensions) {
        if (existing.extensions.count(key) == 0) {
            diffs.insert(key);
        }
    }

    return {diffs.begin(), diffs.end()};
}

void DesignRuleValidator::check(const std::optional<DesignRuleSet>& incoming) {
    if (!seeded_) {
        rules_ = incoming;
        seeded_ = true;
        return;
    }

    if (!rules_ && !incoming) {
        return;
    }
    if (!rules_ || !incoming) {
        // One side has rules, the other has none: the whole set differs.
        const DesignRuleSet& present = rules_ ? *rules_ : *incoming;
        std::vector<std::string> params;
        params.push_back("designrules");
        for (const auto& [key, value] : present.params) {
            params.push_back(key);
        }
        throw DesignRuleMismatchError(std::move(params));
    }

    auto diffs = differing_parameters(*rules_, *incoming);
    if (!diffs.empty()) {
        throw DesignRuleMismatchError(std::move(diffs));
    }
}

} // namespace boardmerge
