/**
 * @file edition_reconciler.hpp
 * @brief Computes the products to request from the installer.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/catalog/product_catalog.hpp"
#include "odtdeploy/catalog/substitution_rules.hpp"
#include "odtdeploy/inventory/installed_inventory.hpp"

namespace odtdeploy
{

/**
 * @brief The edition being deployed, and where it is deployed to.
 */
struct DeploymentTarget
{
    ProductId requested{ProductId::O365ProPlusRetail};
    Platform platform{Platform::X86};

    /**
     * @brief CDN base URL of the target channel; empty disables channel
     *        migration detection.
     */
    std::string channel_url;
};

/**
 * @brief Outcome of reconciling a target with the installed inventory.
 *
 * @details
 * Produced once per run by reconcile() and never modified. The migration
 * flags are informational: they drive logging and the decision to remove
 * the existing Click-to-Run installation, never the target set itself.
 */
struct ReconcileResult
{
    /**
     * @brief Products to request from the installer.
     * @details Unique. The requested edition comes first, followed by the
     *          preserved installed products in inventory order.
     */
    std::vector<ProductId> target_set;

    /**
     * @brief Installed products removed by substitution rules, in rule order.
     */
    std::vector<ProductId> migrated_products;

    /**
     * @brief The installed platform differs from the target platform.
     */
    bool platform_migration{false};

    /**
     * @brief The installed channel differs from the target channel.
     */
    bool channel_migration{false};

    /**
     * @brief At least one substitution rule fired.
     */
    bool product_migration() const noexcept
    {
        return !migrated_products.empty();
    }

    bool contains(ProductId id) const noexcept
    {
        return std::find(target_set.begin(), target_set.end(), id) != target_set.end();
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const;
};

/**
 * @brief Reconcile a deployment target with the installed inventory.
 *
 * @details
 * 1. Start from the requested edition.
 * 2. Add every other installed product.
 * 3. For each rule in order, if its source is in the original inventory and
 *    its requested edition is the target, drop the source.
 *
 * Rules only remove their own source and never re-add a product, so the
 * result does not depend on rule order.
 *
 * @param target The deployment target.
 * @param inventory The installed inventory.
 * @param rules Substitution rules to apply, in order.
 */
ReconcileResult reconcile(
    const DeploymentTarget& target,
    const InstalledInventory& inventory,
    const std::vector<SubstitutionRule>& rules);

/**
 * @brief Reconcile using the built-in substitution rule table.
 */
ReconcileResult reconcile(
    const DeploymentTarget& target,
    const InstalledInventory& inventory);

} // namespace odtdeploy
