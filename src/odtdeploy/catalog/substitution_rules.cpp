#include "odtdeploy/catalog/substitution_rules.hpp"

namespace odtdeploy
{

const std::vector<SubstitutionRule>& substitution_rules()
{
    static const std::vector<SubstitutionRule> rules(
        kSubstitutionRules.begin(), kSubstitutionRules.end());
    return rules;
}

} // namespace odtdeploy
