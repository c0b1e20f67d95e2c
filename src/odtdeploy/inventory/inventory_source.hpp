/**
 * @file inventory_source.hpp
 * @brief Sources of the Click-to-Run inventory.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/inventory/installed_inventory.hpp"

namespace odtdeploy
{

/// Value names under the Click-to-Run configuration key.
constexpr const char* kPlatformValueName = "Platform";
constexpr const char* kCdnBaseUrlValueName = "CDNBaseUrl";
constexpr const char* kProductReleaseIdsValueName = "ProductReleaseIds";

/// Click-to-Run configuration key, relative to HKEY_LOCAL_MACHINE.
constexpr const char* kClickToRunConfigurationKey =
    "SOFTWARE\\Microsoft\\Office\\ClickToRun\\Configuration";

/**
 * @brief Raw values of the Click-to-Run configuration key.
 *
 * @details
 * Absent values are empty strings.
 */
struct ClickToRunValues
{
    std::string platform;
    std::string cdn_base_url;
    std::string product_release_ids;
};

/**
 * @brief Build an InstalledInventory from raw configuration values.
 *
 * @details
 * `product_release_ids` is comma-delimited. Release ids outside the product
 * catalog are skipped with a warning; duplicates are dropped. An unrecognized
 * platform value is logged and left unset. A platform or channel with no
 * catalog product is logged as a warning, since the reconciler ignores both
 * for an empty inventory.
 */
InstalledInventory parse_inventory(const ClickToRunValues& values, DeployLog& log);

/**
 * @brief Interface for reading the current Click-to-Run inventory.
 */
class IInventorySource
{
public:
    virtual ~IInventorySource() = default;

    /**
     * @brief Read the inventory.
     * @throws DeploymentError with code InventoryUnavailable if the persisted
     *         state exists but cannot be read.
     */
    virtual InstalledInventory read_inventory() = 0;
};

/**
 * @brief Reads the configuration values from a snapshot file.
 *
 * @details
 * The snapshot holds one `Name=Value` line per value, in the format of a
 * registry export (`"Platform"="x64"`) or plain (`Platform=x64`). UTF-16LE
 * (as written by `reg export`) and UTF-8 with or without a BOM are accepted;
 * UTF-16BE is rejected with InventoryUnavailable. Section
 * headers (`[...]`) and comment lines (`;`, `#`) are ignored. A missing file
 * stands for a missing configuration key and yields an empty inventory.
 */
class SnapshotInventorySource : public IInventorySource
{
public:
    SnapshotInventorySource(std::string path, DeployLog& log);

    InstalledInventory read_inventory() override;

private:
    std::string m_path;
    DeployLog& m_log;
};

#ifdef _WIN32
/**
 * @brief Reads the configuration values from the registry (64-bit view).
 */
class RegistryInventorySource : public IInventorySource
{
public:
    explicit RegistryInventorySource(DeployLog& log);

    InstalledInventory read_inventory() override;

private:
    DeployLog& m_log;
};
#endif

} // namespace odtdeploy
