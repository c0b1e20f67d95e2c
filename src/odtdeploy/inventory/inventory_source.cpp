#include "odtdeploy/inventory/inventory_source.hpp"
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/common/string_util.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

namespace odtdeploy
{

namespace
{

const std::string kSource = "Inventory";

std::string unquote(const std::string& text)
{
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"')
    {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

// Registry exports (regedit /e, reg export) are UTF-16LE with a BOM. Value
// names and the values read here are ASCII; other code units become '?'.
std::string decode_snapshot(const std::string& bytes)
{
    if (bytes.size() >= 3 && static_cast<unsigned char>(bytes[0]) == 0xEF &&
        static_cast<unsigned char>(bytes[1]) == 0xBB && static_cast<unsigned char>(bytes[2]) == 0xBF)
    {
        return bytes.substr(3);
    }
    if (bytes.size() >= 2 && static_cast<unsigned char>(bytes[0]) == 0xFE &&
        static_cast<unsigned char>(bytes[1]) == 0xFF)
    {
        throw DeploymentError(DeploymentErrorCode::InventoryUnavailable,
            "Unsupported snapshot encoding UTF-16BE");
    }
    if (bytes.size() < 2 || static_cast<unsigned char>(bytes[0]) != 0xFF ||
        static_cast<unsigned char>(bytes[1]) != 0xFE)
    {
        return bytes;
    }

    std::string text;
    text.reserve(bytes.size() / 2);
    for (size_t i = 2; i + 1 < bytes.size(); i += 2)
    {
        unsigned int unit = static_cast<unsigned char>(bytes[i]) |
            (static_cast<unsigned int>(static_cast<unsigned char>(bytes[i + 1])) << 8);
        text.push_back(unit < 0x80 ? static_cast<char>(unit) : '?');
    }
    return text;
}

#ifdef _WIN32
// Absent or non-string values read as empty.
std::string read_registry_string(HKEY key, const char* name)
{
    DWORD type = 0;
    DWORD size = 0;
    if (RegQueryValueExA(key, name, NULL, &type, NULL, &size) != ERROR_SUCCESS)
    {
        return std::string();
    }
    if (type != REG_SZ && type != REG_EXPAND_SZ)
    {
        return std::string();
    }
    std::vector<char> buf(size + 1, '\0');
    if (RegQueryValueExA(key, name, NULL, &type,
                         reinterpret_cast<LPBYTE>(&buf[0]), &size) != ERROR_SUCCESS)
    {
        return std::string();
    }
    return std::string(&buf[0]);
}
#endif

} // namespace

InstalledInventory parse_inventory(const ClickToRunValues& values, DeployLog& log)
{
    InstalledInventory inventory;

    for (const auto& release_id : split_list(values.product_release_ids, ','))
    {
        auto id = parse_product_id(release_id);
        if (!id)
        {
            log.warning(kSource, "Ignoring product release id outside the catalog: " + release_id);
            continue;
        }
        if (!inventory.contains(*id))
        {
            inventory.products.push_back(*id);
        }
    }

    if (!trim(values.platform).empty())
    {
        inventory.platform = parse_platform(values.platform);
        if (!inventory.platform)
        {
            log.warning(kSource, "Unrecognized platform value: " + values.platform);
        }
    }

    inventory.channel_url = trim(values.cdn_base_url);

    if (inventory.empty() && (!trim(values.platform).empty() || !inventory.channel_url.empty()))
    {
        log.warning(kSource, "Click-to-Run configuration present but no catalog product installed (" +
            (trim(values.product_release_ids).empty() ? std::string("no product release ids")
                                                      : "ProductReleaseIds=" + trim(values.product_release_ids)) +
            "); platform and channel migration are not evaluated");
    }
    return inventory;
}

SnapshotInventorySource::SnapshotInventorySource(std::string path, DeployLog& log)
    : m_path{std::move(path)}
    , m_log{log}
{}

InstalledInventory SnapshotInventorySource::read_inventory()
{
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec))
    {
        m_log.info(kSource, "No Click-to-Run configuration snapshot at " + m_path +
            "; treating the machine as having no Click-to-Run installation");
        return InstalledInventory{};
    }

    std::ifstream file(m_path, std::ios::binary);
    if (!file.is_open())
    {
        throw DeploymentError(DeploymentErrorCode::InventoryUnavailable,
            "Failed to open Click-to-Run configuration snapshot: " + m_path);
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        throw DeploymentError(DeploymentErrorCode::InventoryUnavailable,
            "Failed to read Click-to-Run configuration snapshot: " + m_path);
    }

    std::istringstream in(decode_snapshot(bytes));
    ClickToRunValues values;
    std::string line;
    while (std::getline(in, line))
    {
        std::string text = trim(line);
        if (text.empty() || text[0] == '[' || text[0] == ';' || text[0] == '#')
        {
            continue;
        }
        size_t eq = text.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string name = unquote(trim(text.substr(0, eq)));
        std::string value = unquote(trim(text.substr(eq + 1)));

        if (iequals(name, kPlatformValueName))
        {
            values.platform = value;
        }
        else if (iequals(name, kCdnBaseUrlValueName))
        {
            values.cdn_base_url = value;
        }
        else if (iequals(name, kProductReleaseIdsValueName))
        {
            values.product_release_ids = value;
        }
    }

    InstalledInventory inventory = parse_inventory(values, m_log);
    m_log.info(kSource, "Click-to-Run inventory: " + inventory.summary());
    return inventory;
}

#ifdef _WIN32
RegistryInventorySource::RegistryInventorySource(DeployLog& log)
    : m_log{log}
{}

InstalledInventory RegistryInventorySource::read_inventory()
{
    HKEY key = NULL;
    LONG rc = RegOpenKeyExA(HKEY_LOCAL_MACHINE, kClickToRunConfigurationKey, 0,
                            KEY_READ | KEY_WOW64_64KEY, &key);
    if (rc == ERROR_FILE_NOT_FOUND)
    {
        m_log.info(kSource, "Click-to-Run configuration key not present");
        return InstalledInventory{};
    }
    if (rc != ERROR_SUCCESS)
    {
        throw DeploymentError(DeploymentErrorCode::InventoryUnavailable,
            "Failed to open HKLM\\" + std::string(kClickToRunConfigurationKey) +
            " (error " + std::to_string(rc) + ")");
    }

    ClickToRunValues values;
    values.platform = read_registry_string(key, kPlatformValueName);
    values.cdn_base_url = read_registry_string(key, kCdnBaseUrlValueName);
    values.product_release_ids = read_registry_string(key, kProductReleaseIdsValueName);
    RegCloseKey(key);

    InstalledInventory inventory = parse_inventory(values, m_log);
    m_log.info(kSource, "Click-to-Run inventory: " + inventory.summary());
    return inventory;
}
#endif

} // namespace odtdeploy
