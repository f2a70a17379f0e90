/**
 * @file test_design_rules.cpp
 * @brief Tests for design rule equivalence
 */

#include <gtest/gtest.h>
#include "boardmerge/DesignRules.hpp"
#include "boardmerge/Errors.hpp"

using namespace boardmerge;

namespace {

DesignRuleSet default_rules() {
    DesignRuleSet rules;
    rules.name = "default";
    rules.params = {{"mdWireWire", "8mil"}, {"msDrill", "0.35mm"}, {"rlMinPadTop", "10mil"}};
    return rules;
}

} // anonymous namespace

TEST(DifferingParameters, IdenticalSets) {
    EXPECT_TRUE(differing_parameters(default_rules(), default_rules()).empty());
}

TEST(DifferingParameters, ReportsEveryDifferenceSorted) {
    DesignRuleSet other = default_rules();
    other.name = "fab2";
    other.params["msDrill"] = "0.3mm";
    other.params.erase("rlMinPadTop");
    other.params["mlMinStopFrame"] = "4mil";

    auto diffs = differing_parameters(default_rules(), other);
    std::vector<std::string> expected = {"mlMinStopFrame", "msDrill", "name", "rlMinPadTop"};
    EXPECT_EQ(diffs, expected);
}

TEST(DifferingParameters, ValuesCompareAsText) {
    DesignRuleSet other = default_rules();
    other.params["msDrill"] = "0.350mm";
    EXPECT_EQ(differing_parameters(default_rules(), other),
              std::vector<std::string>{"msDrill"});
}

TEST(DesignRuleValidator, FirstInputSeeds) {
    DesignRuleValidator validator;
    EXPECT_FALSE(validator.seeded());
    validator.check(default_rules());
    EXPECT_TRUE(validator.seeded());
    ASSERT_TRUE(validator.rules().has_value());
    EXPECT_TRUE(*validator.rules() == default_rules());
}

TEST(DesignRuleValidator, IdenticalSetsPass) {
    DesignRuleValidator validator;
    validator.check(default_rules());
    EXPECT_NO_THROW(validator.check(default_rules()));
}

TEST(DesignRuleValidator, DifferingParameterFails) {
    DesignRuleValidator validator;
    validator.check(default_rules());

    DesignRuleSet other = default_rules();
    other.params["msDrill"] = "0.3mm";
    try {
        validator.check(other);
        FAIL() << "Expected DesignRuleMismatchError";
    } catch (const DesignRuleMismatchError& e) {
        EXPECT_EQ(e.parameters(), std::vector<std::string>{"msDrill"});
        EXPECT_STREQ(e.what(),
                     "Design rules must be equivalent, differing parameters: ['msDrill']");
    }
}

TEST(DesignRuleValidator, RulesOnOneSideOnly) {
    DesignRuleValidator validator;
    validator.check(std::nullopt);

    try {
        validator.check(default_rules());
        FAIL() << "Expected DesignRuleMismatchError";
    } catch (const DesignRuleMismatchError& e) {
        ASSERT_FALSE(e.parameters().empty());
        EXPECT_EQ(e.parameters()[0], "designrules");
    }
}

TEST(DesignRuleValidator, NoRulesAnywhere) {
    DesignRuleValidator validator;
    validator.check(std::nullopt);
    EXPECT_NO_THROW(validator.check(std::nullopt));
    EXPECT_FALSE(validator.rules().has_value());
}
