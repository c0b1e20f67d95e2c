#include "odtdeploy/reconcile/edition_reconciler.hpp"
#include "odtdeploy/catalog/update_channel.hpp"

namespace odtdeploy
{

namespace
{

std::string join_products(const std::vector<ProductId>& products)
{
    std::string result;
    for (size_t i = 0; i < products.size(); ++i)
    {
        if (i > 0)
        {
            result += ",";
        }
        result += to_string(products[i]);
    }
    return result;
}

} // namespace

std::string ReconcileResult::summary() const
{
    std::string result = "target=[" + join_products(target_set) + "]";
    result += ", migrated=[" + join_products(migrated_products) + "]";
    result += ", platform_migration=";
    result += platform_migration ? "yes" : "no";
    result += ", channel_migration=";
    result += channel_migration ? "yes" : "no";
    return result;
}

ReconcileResult reconcile(
    const DeploymentTarget& target,
    const InstalledInventory& inventory,
    const std::vector<SubstitutionRule>& rules)
{
    ReconcileResult result;
    result.target_set.push_back(target.requested);

    if (inventory.empty())
    {
        return result;
    }

    for (ProductId installed : inventory.products)
    {
        if (!result.contains(installed))
        {
            result.target_set.push_back(installed);
        }
    }

    for (const auto& rule : rules)
    {
        if (rule.requested != target.requested || !inventory.contains(rule.source))
        {
            continue;
        }
        auto it = std::find(result.target_set.begin(), result.target_set.end(), rule.source);
        if (it != result.target_set.end())
        {
            result.target_set.erase(it);
            result.migrated_products.push_back(rule.source);
        }
    }

    result.platform_migration =
        inventory.platform.has_value() && *inventory.platform != target.platform;

    result.channel_migration =
        !inventory.channel_url.empty() && !target.channel_url.empty() &&
        !same_cdn_url(inventory.channel_url, target.channel_url);

    return result;
}

ReconcileResult reconcile(
    const DeploymentTarget& target,
    const InstalledInventory& inventory)
{
    return reconcile(target, inventory, substitution_rules());
}

} // namespace odtdeploy
