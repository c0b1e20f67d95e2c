/**
 * @file installed_applications.hpp
 * @brief Display names of installed applications.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"

namespace odtdeploy
{

/**
 * @brief Interface for listing installed applications by display name.
 */
class IInstalledApplications
{
public:
    virtual ~IInstalledApplications() = default;

    /**
     * @brief Get the display names of all installed applications.
     * @throws DeploymentError with code InventoryUnavailable on read failure.
     */
    virtual std::vector<std::string> display_names() = 0;
};

/**
 * @brief Reads display names from a text file, one per line.
 *
 * @details
 * Blank lines and lines starting with '#' are ignored. A missing file is an
 * empty list.
 */
class ListFileInstalledApplications : public IInstalledApplications
{
public:
    ListFileInstalledApplications(std::string path, DeployLog& log);

    std::vector<std::string> display_names() override;

private:
    std::string m_path;
    DeployLog& m_log;
};

#ifdef _WIN32
/**
 * @brief Reads `DisplayName` values from the machine and user uninstall keys.
 */
class RegistryInstalledApplications : public IInstalledApplications
{
public:
    explicit RegistryInstalledApplications(DeployLog& log);

    std::vector<std::string> display_names() override;

private:
    DeployLog& m_log;
};
#endif

} // namespace odtdeploy
