#include "odtdeploy/config/deployment_config.hpp"
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/common/string_util.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <tinyxml2.h>

namespace odtdeploy
{

namespace
{

namespace fs = std::filesystem;

constexpr const char* kRootElement = "OdtDeploy_Config";

[[noreturn]] void invalid(const std::string& message)
{
    throw DeploymentError(DeploymentErrorCode::ConfigurationInvalid, message);
}

std::string resolve(const std::string& base_dir, const std::string& path)
{
    if (path.empty() || base_dir.empty() || fs::path(path).is_absolute())
    {
        return path;
    }
    return (fs::path(base_dir) / path).lexically_normal().string();
}

void read_path(const tinyxml2::XMLElement* element, const char* name,
               const std::string& base_dir, std::string& out)
{
    const char* value = element->Attribute(name);
    if (value)
    {
        out = resolve(base_dir, trim(value));
    }
}

bool parse_bool(const std::string& element, const char* name, const char* value)
{
    std::string text = to_lower_ascii(trim(value));
    if (text == "true" || text == "1" || text == "yes")
    {
        return true;
    }
    if (text == "false" || text == "0" || text == "no")
    {
        return false;
    }
    invalid(element + "/@" + name + ": expected a boolean, got '" + value + "'");
}

int parse_exit_code(const std::string& text)
{
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE ||
        value < INT_MIN || value > INT_MAX)
    {
        invalid("ExitCodes/@Success: invalid exit code '" + text + "'");
    }
    return static_cast<int>(value);
}

void read_paths(const tinyxml2::XMLElement* root, const std::string& base_dir,
                DeploymentConfig& config)
{
    const tinyxml2::XMLElement* paths = root->FirstChildElement("Paths");
    if (!paths)
    {
        return;
    }
    read_path(paths, "SupportFiles", base_dir, config.support_files_dir);
    read_path(paths, "Logs", base_dir, config.log_dir);
    read_path(paths, "Setup", base_dir, config.setup_path);
    read_path(paths, "ConfigurationFile", base_dir, config.configuration_file);

    // A bare executable name is looked up on PATH, so it is not resolved.
    if (const char* host = paths->Attribute("ScriptHost"))
    {
        config.script_host = trim(host);
    }
}

void read_office(const tinyxml2::XMLElement* root, DeploymentConfig& config)
{
    const tinyxml2::XMLElement* office = root->FirstChildElement("Office");
    if (!office)
    {
        return;
    }
    if (const char* value = office->Attribute("Platform"))
    {
        auto platform = parse_platform(value);
        if (!platform)
        {
            invalid(std::string("Office/@Platform: unknown platform '") + value + "'");
        }
        config.platform = *platform;
    }
    if (const char* value = office->Attribute("Channel"))
    {
        auto channel = parse_update_channel(value);
        if (!channel)
        {
            invalid(std::string("Office/@Channel: unknown channel '") + value + "'");
        }
        config.channel = *channel;
    }
    if (const char* value = office->Attribute("Language"))
    {
        config.language = trim(value);
    }
    if (const char* value = office->Attribute("ForceAppShutdown"))
    {
        config.force_app_shutdown = parse_bool("Office", "ForceAppShutdown", value);
    }
}

void read_inventory(const tinyxml2::XMLElement* root, const std::string& base_dir,
                    DeploymentConfig& config)
{
    const tinyxml2::XMLElement* inventory = root->FirstChildElement("Inventory");
    if (!inventory)
    {
        return;
    }
    read_path(inventory, "Snapshot", base_dir, config.inventory_snapshot);
    read_path(inventory, "InstalledApplications", base_dir, config.installed_applications_list);
}

void read_product_keys(const tinyxml2::XMLElement* root, DeploymentConfig& config)
{
    const tinyxml2::XMLElement* keys = root->FirstChildElement("ProductKeys");
    if (!keys)
    {
        return;
    }
    for (const tinyxml2::XMLElement* key = keys->FirstChildElement("Key"); key;
         key = key->NextSiblingElement("Key"))
    {
        const char* product = key->Attribute("Product");
        const char* value = key->Attribute("Value");
        if (!product || !value)
        {
            invalid("ProductKeys/Key: both Product and Value are required");
        }
        auto id = parse_product_id(product);
        if (!id)
        {
            invalid(std::string("ProductKeys/Key: unknown product '") + product + "'");
        }
        if (!product_info(*id).requires_product_key())
        {
            invalid(std::string("ProductKeys/Key: ") + product + " is not a volume product");
        }
        config.product_keys[*id] = trim(value);
    }
}

void read_exit_codes(const tinyxml2::XMLElement* root, DeploymentConfig& config)
{
    const tinyxml2::XMLElement* codes = root->FirstChildElement("ExitCodes");
    if (!codes)
    {
        return;
    }
    if (const char* value = codes->Attribute("Success"))
    {
        std::vector<int> success;
        for (const auto& item : split_list(value, ','))
        {
            success.push_back(parse_exit_code(item));
        }
        if (success.empty())
        {
            invalid("ExitCodes/@Success: at least one exit code is required");
        }
        config.success_exit_codes = std::move(success);
    }
}

DeploymentConfig read_config(const tinyxml2::XMLDocument& doc, const std::string& base_dir)
{
    const tinyxml2::XMLElement* root = doc.FirstChildElement(kRootElement);
    if (!root)
    {
        invalid(std::string("Missing root element ") + kRootElement);
    }

    DeploymentConfig config = default_deployment_config(base_dir);
    read_paths(root, base_dir, config);
    read_office(root, config);
    read_inventory(root, base_dir, config);
    read_product_keys(root, config);
    read_exit_codes(root, config);
    return config;
}

} // namespace

const char* to_string(DeploymentType type) noexcept
{
    return type == DeploymentType::Install ? "Install" : "Uninstall";
}

const char* to_string(DeployMode mode) noexcept
{
    switch (mode)
    {
        case DeployMode::Interactive:
            return "Interactive";
        case DeployMode::Silent:
            return "Silent";
        case DeployMode::NonInteractive:
            return "NonInteractive";
    }
    return "Unknown";
}

std::optional<DeploymentType> parse_deployment_type(std::string_view text)
{
    std::string value = trim(text);
    if (iequals(value, "install"))
    {
        return DeploymentType::Install;
    }
    if (iequals(value, "uninstall"))
    {
        return DeploymentType::Uninstall;
    }
    return std::nullopt;
}

std::optional<DeployMode> parse_deploy_mode(std::string_view text)
{
    std::string value = trim(text);
    if (iequals(value, "interactive"))
    {
        return DeployMode::Interactive;
    }
    if (iequals(value, "silent"))
    {
        return DeployMode::Silent;
    }
    if (iequals(value, "noninteractive"))
    {
        return DeployMode::NonInteractive;
    }
    return std::nullopt;
}

std::string default_configuration_file()
{
    std::error_code ec;
    fs::path temp = fs::temp_directory_path(ec);
    if (ec)
    {
        temp = fs::path(".");
    }
    return (temp / "odtdeploy" / "configuration.xml").string();
}

DeploymentConfig default_deployment_config(const std::string& base_dir)
{
    DeploymentConfig config;
    config.support_files_dir = resolve(base_dir, config.support_files_dir);
    config.log_dir = resolve(base_dir, config.log_dir);
    config.setup_path = resolve(base_dir, config.setup_path);
    config.configuration_file = default_configuration_file();
    return config;
}

DeploymentConfig parse_deployment_config(const std::string& xml_text, const std::string& base_dir)
{
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml_text.c_str(), xml_text.size()) != tinyxml2::XML_SUCCESS)
    {
        invalid(std::string("Malformed configuration XML: ") + doc.ErrorStr());
    }
    return read_config(doc, base_dir);
}

DeploymentConfig load_deployment_config(const std::string& path)
{
    tinyxml2::XMLDocument doc;
    if (doc.LoadFile(path.c_str()) != tinyxml2::XML_SUCCESS)
    {
        invalid("Failed to load configuration " + path + ": " + doc.ErrorStr());
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec)
    {
        absolute = fs::path(path);
    }
    return read_config(doc, absolute.parent_path().string());
}

} // namespace odtdeploy
