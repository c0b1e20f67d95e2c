/**
 * @file deployment_config.hpp
 * @brief Deployment request and deployment configuration file.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/catalog/product_catalog.hpp"
#include "odtdeploy/catalog/update_channel.hpp"

namespace odtdeploy
{

// ============================================================================
// Request
// ============================================================================

enum class DeploymentType
{
    Install,
    Uninstall
};

/**
 * @brief How much the run may interact with the logged-on user.
 *
 * @details
 * `Interactive` shows the installer UI; `Silent` and `NonInteractive` run it
 * hidden.
 */
enum class DeployMode
{
    Interactive,
    Silent,
    NonInteractive
};

const char* to_string(DeploymentType type) noexcept;
const char* to_string(DeployMode mode) noexcept;

std::optional<DeploymentType> parse_deployment_type(std::string_view text);
std::optional<DeployMode> parse_deploy_mode(std::string_view text);

/**
 * @brief What the caller asked for.
 */
struct DeploymentRequest
{
    ProductId product{ProductId::O365ProPlusRetail};
    DeploymentType type{DeploymentType::Install};
    DeployMode mode{DeployMode::Interactive};
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Deployment settings.
 *
 * @details
 * Loaded from an XML file whose root element is `OdtDeploy_Config`:
 *
 * @code{.xml}
 * <OdtDeploy_Config>
 *   <Paths SupportFiles="SupportFiles" Logs="Logs" Setup="Files/setup.exe"
 *          ConfigurationFile="..." ScriptHost="cscript.exe"/>
 *   <Office Platform="x64" Channel="Deferred" Language="MatchOS" ForceAppShutdown="true"/>
 *   <Inventory Snapshot="..." InstalledApplications="..."/>
 *   <ProductKeys>
 *     <Key Product="VisioProXVolume" Value="XXXXX-XXXXX-XXXXX-XXXXX-XXXXX"/>
 *   </ProductKeys>
 *   <ExitCodes Success="0,3010"/>
 * </OdtDeploy_Config>
 * @endcode
 *
 * Every element and attribute is optional. Relative paths are resolved
 * against the directory of the configuration file.
 */
struct DeploymentConfig
{
    std::string support_files_dir{"SupportFiles"};
    std::string log_dir{"Logs"};
    std::string setup_path{"Files/setup.exe"};

    /**
     * @brief Fixed path of the generated ODT document.
     */
    std::string configuration_file;

    std::string script_host{"cscript.exe"};

    Platform platform{Platform::X64};
    UpdateChannel channel{UpdateChannel::Deferred};
    std::string language{"MatchOS"};
    bool force_app_shutdown{true};

    /**
     * @brief Click-to-Run configuration snapshot file; empty reads the registry.
     */
    std::string inventory_snapshot;

    /**
     * @brief Installed application list file; empty reads the registry.
     */
    std::string installed_applications_list;

    std::map<ProductId, std::string> product_keys;

    std::vector<int> success_exit_codes{0, 3010};
};

/**
 * @brief Default location of the generated ODT document
 *        (`<temp>/odtdeploy/configuration.xml`).
 */
std::string default_configuration_file();

/**
 * @brief Default settings with paths resolved against a base directory.
 */
DeploymentConfig default_deployment_config(const std::string& base_dir);

/**
 * @brief Parse configuration XML text.
 * @param xml_text The document.
 * @param base_dir Directory relative paths are resolved against.
 * @throws DeploymentError with code ConfigurationInvalid.
 */
DeploymentConfig parse_deployment_config(const std::string& xml_text, const std::string& base_dir);

/**
 * @brief Load a configuration file.
 * @throws DeploymentError with code ConfigurationInvalid.
 */
DeploymentConfig load_deployment_config(const std::string& path);

} // namespace odtdeploy
