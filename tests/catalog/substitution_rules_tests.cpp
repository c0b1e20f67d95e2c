#include <gtest/gtest.h>
#include "odtdeploy/catalog/substitution_rules.hpp"

using namespace odtdeploy;

namespace
{

bool has_rule(ProductId source, ProductId requested)
{
    for (const auto& rule : substitution_rules())
    {
        if (rule.source == source && rule.requested == requested)
        {
            return true;
        }
    }
    return false;
}

} // namespace

// =============================================================================
// Substitution rule table
// =============================================================================

TEST(SubstitutionRulesTests, Table_HasTenRules)
{
    EXPECT_EQ(substitution_rules().size(), 10u);
}

TEST(SubstitutionRulesTests, Table_EveryRuleIsWellFormed)
{
    for (const auto& rule : substitution_rules())
    {
        EXPECT_TRUE(is_well_formed(rule))
            << to_string(rule.source) << " -> " << to_string(rule.requested);
    }
}

TEST(SubstitutionRulesTests, Table_ContainsVisioRules)
{
    EXPECT_TRUE(has_rule(ProductId::VisioStdXVolume, ProductId::VisioProRetail));
    EXPECT_TRUE(has_rule(ProductId::VisioProXVolume, ProductId::VisioProRetail));
    EXPECT_TRUE(has_rule(ProductId::VisioStdXVolume, ProductId::VisioProXVolume));
    EXPECT_TRUE(has_rule(ProductId::VisioProXVolume, ProductId::VisioStdXVolume));
    EXPECT_TRUE(has_rule(ProductId::VisioProRetail, ProductId::VisioProXVolume));
}

TEST(SubstitutionRulesTests, Table_ContainsProjectRules)
{
    EXPECT_TRUE(has_rule(ProductId::ProjectStdXVolume, ProductId::ProjectProRetail));
    EXPECT_TRUE(has_rule(ProductId::ProjectProXVolume, ProductId::ProjectProRetail));
    EXPECT_TRUE(has_rule(ProductId::ProjectStdXVolume, ProductId::ProjectProXVolume));
    EXPECT_TRUE(has_rule(ProductId::ProjectProXVolume, ProductId::ProjectStdXVolume));
    EXPECT_TRUE(has_rule(ProductId::ProjectProRetail, ProductId::ProjectProXVolume));
}

TEST(SubstitutionRulesTests, Table_RetailIsNotReplacedByStandardVolume)
{
    EXPECT_FALSE(has_rule(ProductId::VisioProRetail, ProductId::VisioStdXVolume));
    EXPECT_FALSE(has_rule(ProductId::ProjectProRetail, ProductId::ProjectStdXVolume));
}

TEST(SubstitutionRulesTests, Table_SuiteIsNeverSubstituted)
{
    for (const auto& rule : substitution_rules())
    {
        EXPECT_NE(rule.source, ProductId::O365ProPlusRetail);
        EXPECT_NE(rule.requested, ProductId::O365ProPlusRetail);
    }
}

TEST(SubstitutionRulesTests, WellFormed_RejectsCrossFamilyRule)
{
    EXPECT_FALSE(is_well_formed({ProductId::VisioStdXVolume, ProductId::ProjectProRetail}));
    EXPECT_FALSE(is_well_formed({ProductId::VisioProRetail, ProductId::VisioProRetail}));
}
