/**
 * @file odt_configuration.hpp
 * @brief Office Deployment Tool configuration document.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/catalog/product_catalog.hpp"
#include "odtdeploy/catalog/update_channel.hpp"

namespace odtdeploy
{

/**
 * @brief Top-level directive of the document.
 */
enum class OdtAction
{
    Add,
    Remove
};

/**
 * @brief Installer UI level.
 */
enum class DisplayLevel
{
    Full,
    None
};

const char* to_string(OdtAction action) noexcept;
const char* to_string(DisplayLevel level) noexcept;

/**
 * @brief One `<Product>` entry.
 */
struct OdtProduct
{
    ProductId id;

    /**
     * @brief Product key written as `PIDKEY`; empty means no key attribute.
     */
    std::string pid_key;
};

/**
 * @brief Settings shared by install and uninstall documents.
 */
struct OdtSettings
{
    Platform platform{Platform::X86};
    std::optional<UpdateChannel> channel;
    std::string language{"MatchOS"};
    DisplayLevel display_level{DisplayLevel::None};

    /**
     * @brief Directory the installer writes its own log to.
     */
    std::string logging_path;

    bool force_app_shutdown{true};

    /**
     * @brief Product keys for volume editions.
     */
    std::map<ProductId, std::string> product_keys;
};

/**
 * @brief The document consumed by `setup.exe /configure`.
 */
struct OdtConfiguration
{
    OdtAction action{OdtAction::Add};

    /**
     * @brief Products listed under the directive, in order.
     */
    std::vector<OdtProduct> products;

    OdtSettings settings;
};

/**
 * @brief Build an install document listing the given products.
 *
 * @details
 * Volume products get their configured key. A missing key is an error for
 * the requested product and a warning (no `PIDKEY`) for preserved products.
 *
 * @param products Products to add, requested edition included.
 * @param requested The requested edition.
 * @param settings Document settings.
 * @param log Log receiving missing-key warnings.
 * @throws DeploymentError with code MissingProductKey.
 */
OdtConfiguration make_install_configuration(
    const std::vector<ProductId>& products,
    ProductId requested,
    const OdtSettings& settings,
    DeployLog& log);

/**
 * @brief Build an uninstall document removing only the requested product.
 */
OdtConfiguration make_uninstall_configuration(ProductId requested, const OdtSettings& settings);

/**
 * @brief Serialize the document.
 */
std::string to_xml(const OdtConfiguration& configuration);

/**
 * @brief Replace the document at a fixed path.
 *
 * @details
 * Any existing file is deleted first, then the document is written. Missing
 * parent directories are created.
 *
 * @throws DeploymentError with code ConfigurationWriteFailed.
 */
void write_configuration(const OdtConfiguration& configuration, const std::string& path);

} // namespace odtdeploy
