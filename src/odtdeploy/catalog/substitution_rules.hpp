/**
 * @file substitution_rules.hpp
 * @brief Static table of edition substitution rules.
 */
#pragma once
#include "odtdeploy/catalog/product_catalog.hpp"

namespace odtdeploy
{

/**
 * @brief One directional edition substitution.
 *
 * @details
 * When `source` is installed and `requested` is the edition being deployed,
 * `source` is dropped from the products handed to the installer: the
 * requested edition replaces it.
 */
struct SubstitutionRule
{
    ProductId source;
    ProductId requested;
};

constexpr size_t kSubstitutionRuleCount = 10;

/**
 * @brief The substitution rules, in application order.
 *
 * @details
 * Per family (Visio, Project):
 * - standard volume and professional volume to the retail subscription,
 * - standard volume to professional volume and back,
 * - retail subscription to professional volume.
 *
 * There is no rule from the retail subscription to the standard volume tier.
 */
constexpr std::array<SubstitutionRule, kSubstitutionRuleCount> kSubstitutionRules{{
    {ProductId::VisioStdXVolume, ProductId::VisioProRetail},
    {ProductId::VisioProXVolume, ProductId::VisioProRetail},
    {ProductId::ProjectStdXVolume, ProductId::ProjectProRetail},
    {ProductId::ProjectProXVolume, ProductId::ProjectProRetail},
    {ProductId::VisioStdXVolume, ProductId::VisioProXVolume},
    {ProductId::VisioProXVolume, ProductId::VisioStdXVolume},
    {ProductId::ProjectStdXVolume, ProductId::ProjectProXVolume},
    {ProductId::ProjectProXVolume, ProductId::ProjectStdXVolume},
    {ProductId::VisioProRetail, ProductId::VisioProXVolume},
    {ProductId::ProjectProRetail, ProductId::ProjectProXVolume},
}};

/**
 * @brief Check that a rule relates two distinct editions of one companion family.
 */
constexpr bool is_well_formed(const SubstitutionRule& rule) noexcept
{
    const auto& source = product_info(rule.source);
    const auto& requested = product_info(rule.requested);
    return rule.source != rule.requested &&
        source.family == requested.family &&
        source.family != ProductFamily::Suite;
}

/**
 * @brief Check that every rule is well formed and no rule is listed twice.
 */
constexpr bool rule_table_is_valid() noexcept
{
    for (size_t i = 0; i < kSubstitutionRules.size(); ++i)
    {
        if (!is_well_formed(kSubstitutionRules[i]))
        {
            return false;
        }
        for (size_t j = i + 1; j < kSubstitutionRules.size(); ++j)
        {
            if (kSubstitutionRules[i].source == kSubstitutionRules[j].source &&
                kSubstitutionRules[i].requested == kSubstitutionRules[j].requested)
            {
                return false;
            }
        }
    }
    return true;
}

static_assert(rule_table_is_valid(), "substitution rules must stay within one companion family");

/**
 * @brief The rule table as a vector, in application order.
 */
const std::vector<SubstitutionRule>& substitution_rules();

} // namespace odtdeploy
