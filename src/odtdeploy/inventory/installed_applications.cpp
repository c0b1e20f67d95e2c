#include "odtdeploy/inventory/installed_applications.hpp"
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/common/string_util.hpp"
#include <filesystem>
#include <fstream>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

namespace odtdeploy
{

namespace
{

const std::string kSource = "InstalledApplications";

#ifdef _WIN32
struct UninstallRoot
{
    HKEY root;
    const char* path;
    REGSAM view;
};

const UninstallRoot kUninstallRoots[] = {
    {HKEY_LOCAL_MACHINE, "SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall", KEY_WOW64_64KEY},
    {HKEY_LOCAL_MACHINE, "SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall", KEY_WOW64_32KEY},
    {HKEY_CURRENT_USER, "SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall", 0},
};

void collect_display_names(const UninstallRoot& root, std::vector<std::string>& out)
{
    HKEY parent = NULL;
    if (RegOpenKeyExA(root.root, root.path, 0, KEY_READ | root.view, &parent) != ERROR_SUCCESS)
    {
        return;
    }

    char name[256];
    for (DWORD index = 0;; ++index)
    {
        DWORD name_len = sizeof(name);
        LONG rc = RegEnumKeyExA(parent, index, name, &name_len, NULL, NULL, NULL, NULL);
        if (rc != ERROR_SUCCESS)
        {
            break;
        }

        HKEY child = NULL;
        if (RegOpenKeyExA(parent, name, 0, KEY_READ | root.view, &child) != ERROR_SUCCESS)
        {
            continue;
        }
        char value[1024];
        DWORD type = 0;
        DWORD size = sizeof(value) - 1;
        if (RegQueryValueExA(child, "DisplayName", NULL, &type,
                             reinterpret_cast<LPBYTE>(value), &size) == ERROR_SUCCESS &&
            (type == REG_SZ || type == REG_EXPAND_SZ))
        {
            value[size < sizeof(value) ? size : sizeof(value) - 1] = '\0';
            std::string display_name = trim(value);
            if (!display_name.empty())
            {
                out.push_back(display_name);
            }
        }
        RegCloseKey(child);
    }
    RegCloseKey(parent);
}
#endif

} // namespace

ListFileInstalledApplications::ListFileInstalledApplications(std::string path, DeployLog& log)
    : m_path{std::move(path)}
    , m_log{log}
{}

std::vector<std::string> ListFileInstalledApplications::display_names()
{
    std::vector<std::string> names;

    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec))
    {
        m_log.info(kSource, "No installed application list at " + m_path);
        return names;
    }

    std::ifstream in(m_path);
    if (!in.is_open())
    {
        throw DeploymentError(DeploymentErrorCode::InventoryUnavailable,
            "Failed to open installed application list: " + m_path);
    }

    std::string line;
    while (std::getline(in, line))
    {
        std::string text = trim(line);
        if (text.empty() || text[0] == '#')
        {
            continue;
        }
        names.push_back(std::move(text));
    }
    if (in.bad())
    {
        throw DeploymentError(DeploymentErrorCode::InventoryUnavailable,
            "Failed to read installed application list: " + m_path);
    }
    return names;
}

#ifdef _WIN32
RegistryInstalledApplications::RegistryInstalledApplications(DeployLog& log)
    : m_log{log}
{}

std::vector<std::string> RegistryInstalledApplications::display_names()
{
    std::vector<std::string> names;
    for (const auto& root : kUninstallRoots)
    {
        collect_display_names(root, names);
    }
    m_log.info(kSource, "Found " + std::to_string(names.size()) + " installed applications");
    return names;
}
#endif

} // namespace odtdeploy
