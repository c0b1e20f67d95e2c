#include "odtdeploy/deploy/deployment_main.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/common/exit_codes.hpp"
#include "odtdeploy/config/command_line.hpp"
#include "odtdeploy/config/deployment_config.hpp"
#include "odtdeploy/deploy/deployment_session.hpp"
#include "odtdeploy/execution/process_runner.hpp"
#include "odtdeploy/inventory/installed_applications.hpp"
#include "odtdeploy/inventory/inventory_source.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace odtdeploy
{

namespace
{

constexpr const char* kSource = "Main";

std::unique_ptr<IInventorySource> make_inventory_source(const DeploymentConfig& config, DeployLog& log)
{
    if (!config.inventory_snapshot.empty())
    {
        return std::make_unique<SnapshotInventorySource>(config.inventory_snapshot, log);
    }
#ifdef _WIN32
    return std::make_unique<RegistryInventorySource>(log);
#else
    throw DeploymentError(DeploymentErrorCode::ConfigurationInvalid,
        "Inventory/@Snapshot is required on this platform");
#endif
}

std::unique_ptr<IInstalledApplications> make_installed_applications(
    const DeploymentConfig& config, DeployLog& log)
{
    if (!config.installed_applications_list.empty())
    {
        return std::make_unique<ListFileInstalledApplications>(config.installed_applications_list, log);
    }
#ifdef _WIN32
    return std::make_unique<RegistryInstalledApplications>(log);
#else
    throw DeploymentError(DeploymentErrorCode::ConfigurationInvalid,
        "Inventory/@InstalledApplications is required on this platform");
#endif
}

} // namespace

int run_deployment_main(const std::vector<std::string>& args, std::ostream& out, std::ostream& err)
{
    DeployLog log(&err);
    CommandLine cl;
    DeploymentConfig config;
    std::unique_ptr<IInventorySource> inventory_source;
    std::unique_ptr<IInstalledApplications> installed_applications;
    try
    {
        cl = parse_command_line(args);
        if (cl.help)
        {
            out << usage_text() << std::flush;
            return kExitSuccess;
        }
        config = cl.config_path.empty()
            ? default_deployment_config(std::filesystem::current_path().string())
            : load_deployment_config(cl.config_path);
        inventory_source = make_inventory_source(config, log);
        installed_applications = make_installed_applications(config, log);
    }
    catch (const DeploymentError& e)
    {
        err << "Error: " << e.what() << "\n\n" << usage_text() << std::flush;
        return kExitInvalidArguments;
    }
    catch (const std::exception& e)
    {
        err << "Error: " << e.what() << "\n" << std::flush;
        return kExitInvalidArguments;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.log_dir, ec);
    std::string log_path = (std::filesystem::path(config.log_dir) / log_file_name(cl.request)).string();
    if (ec || !log.open_file(log_path))
    {
        log.warning(kSource, "Cannot open log file " + log_path + "; logging to console only");
    }

    try
    {
        SystemProcessRunner process_runner;
        DeploymentSession session(config, *inventory_source, *installed_applications,
                                  process_runner, log);

        if (cl.plan_only)
        {
            out << session.plan(cl.request).describe() << std::flush;
            return kExitSuccess;
        }
        return session.run(cl.request);
    }
    catch (const std::exception& e)
    {
        log.error(kSource, e.what());
        err << "\n\nError:\n" << e.what() << "\n" << std::flush;
        return kExitUnexpectedError;
    }
}

} // namespace odtdeploy
