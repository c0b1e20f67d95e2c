/**
 * @file installed_inventory.hpp
 * @brief InstalledInventory, the Click-to-Run state found at run start.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/catalog/product_catalog.hpp"

namespace odtdeploy
{

/**
 * @brief Click-to-Run products, platform and channel found on the machine.
 *
 * @details
 * Read once at the start of a run and never modified afterwards. A machine
 * without a Click-to-Run installation yields an empty inventory with no
 * platform and no channel URL.
 */
struct InstalledInventory
{
    /**
     * @brief Installed catalog products, unique, in the order they were recorded.
     */
    std::vector<ProductId> products;

    /**
     * @brief Installed platform, if recorded.
     */
    std::optional<Platform> platform;

    /**
     * @brief CDN base URL of the installed channel; empty if not recorded.
     */
    std::string channel_url;

    bool empty() const noexcept
    {
        return products.empty();
    }

    bool contains(ProductId id) const noexcept
    {
        return std::find(products.begin(), products.end(), id) != products.end();
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "products=[";
        for (size_t i = 0; i < products.size(); ++i)
        {
            if (i > 0)
            {
                result += ",";
            }
            result += to_string(products[i]);
        }
        result += "], platform=";
        result += platform ? to_string(*platform) : "(none)";
        result += ", channel=";
        result += channel_url.empty() ? "(none)" : channel_url;
        return result;
    }
};

} // namespace odtdeploy
