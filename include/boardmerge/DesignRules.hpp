/**
 * @file DesignRules.hpp
 * @brief Design rule equivalence across inputs
 *
 * Design rules encode manufacturing constraints (clearances, drill sizes,
 * annular rings). A panel is manufactured as one board, so every input
 * must carry exactly the same rule set. Values are compared as text with
 * no tolerance.
 */

#ifndef BOARDMERGE_DESIGNRULES_HPP
#define BOARDMERGE_DESIGNRULES_HPP

#include "boardmerge/Document.hpp"

#include <optional>
#include <string>
#include <vector>

namespace boardmerge {

/**
 * @brief Names of all parameters that differ between two rule sets
 *
 * The set name and description are reported as "name" and "description".
 * Parameters present on one side only are included. Result is sorted.
 */
std::vector<std::string> differing_parameters(const DesignRuleSet& existing,
                                              const DesignRuleSet& incoming);

/**
 * @brief Holds the accumulated rule set of one merge run
 *
 * The first checked input seeds the accumulated set, even when it carries
 * no rules at all; every later input must match it exactly.
 */
class DesignRuleValidator {
public:
    DesignRuleValidator() = default;

    /**
     * @brief Check an input's rules against the accumulated ones
     *
     * @param incoming Rule set of the input being merged
     * @throws DesignRuleMismatchError listing the differing parameters
     */
    void check(const std::optional<DesignRuleSet>& incoming);

    /// Whether an input has been checked yet
    bool seeded() const noexcept { return seeded_; }

    /// Accumulated rule set (nullopt before seeding or for rule-less inputs)
    const std::optional<DesignRuleSet>& rules() const noexcept { return rules_; }

private:
    bool seeded_ = false;
    std::optional<DesignRuleSet> rules_;
};

} // namespace boardmerge

#endif // BOARDMERGE_DESIGNRULES_HPP
