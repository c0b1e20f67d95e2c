#include "odtdeploy/deploy/deployment_session.hpp"
#include "odtdeploy/common/exit_codes.hpp"
#include <filesystem>

namespace odtdeploy
{

namespace
{

const std::string kSource = "Session";

} // namespace

int final_exit_code(const RunResult& result)
{
    int code = kExitSuccess;
    for (const auto& outcome : result.outcomes)
    {
        if (outcome.state == StepState::Failed)
        {
            code = outcome.exit_code;
        }
        if (outcome.role == StepRole::Terminal && outcome.ran())
        {
            code = outcome.exit_code;
        }
    }
    return code;
}

std::string log_file_name(const DeploymentRequest& request)
{
    return std::string("odtdeploy_") + to_string(request.product) + "_" +
        to_string(request.type) + ".log";
}

DeploymentSession::DeploymentSession(
    DeploymentConfig config,
    IInventorySource& inventory_source,
    IInstalledApplications& installed_applications,
    IProcessRunner& process_runner,
    DeployLog& log)
    : m_config{std::move(config)}
    , m_log{log}
    , m_planner{m_config, inventory_source, installed_applications, process_runner, log}
{}

bool DeploymentSession::check_bootstrap(std::string& missing) const
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(m_config.support_files_dir, ec))
    {
        missing = "support files directory " + m_config.support_files_dir;
        return false;
    }
    if (!fs::is_regular_file(m_config.setup_path, ec))
    {
        missing = "setup executable " + m_config.setup_path;
        return false;
    }
    return true;
}

DeploymentPlan DeploymentSession::plan(const DeploymentRequest& request)
{
    return m_planner.plan(request);
}

int DeploymentSession::run(const DeploymentRequest& request)
{
    try
    {
        return run_unguarded(request);
    }
    catch (const std::exception& e)
    {
        m_log.error(kSource, std::string("Deployment failed: ") + e.what());
        if (request.mode == DeployMode::Interactive)
        {
            std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        }
        m_log.info(kSource, "Exit code " + std::to_string(kExitUnexpectedError));
        return kExitUnexpectedError;
    }
    catch (...)
    {
        m_log.error(kSource, "Deployment failed: unknown exception");
        m_log.info(kSource, "Exit code " + std::to_string(kExitUnexpectedError));
        return kExitUnexpectedError;
    }
}

int DeploymentSession::run_unguarded(const DeploymentRequest& request)
{
    m_log.info(kSource, std::string("Starting ") + to_string(request.type) + " of " +
        to_string(request.product) + " (" + to_string(request.mode) + ")");

    std::string missing;
    if (!check_bootstrap(missing))
    {
        m_log.error(kSource, "Missing " + missing);
        m_log.info(kSource, "Exit code " + std::to_string(kExitBootstrapFailure));
        return kExitBootstrapFailure;
    }

    DeploymentPlan plan = m_planner.plan(request);

    StepRunnerConfig runner_config;
    runner_config.success_exit_codes = m_config.success_exit_codes;
    runner_config.abort_on_failure = false;
    runner_config.abort_on_fault = true;
    SequentialStepRunner runner(runner_config, &m_log);

    m_last_result = runner.run(plan.steps);
    m_last_result.rethrow_if_faulted();

    int code = final_exit_code(m_last_result);
    if (code == kExitRebootRequired)
    {
        m_log.warning(kSource, "A restart is required to complete the deployment");
    }
    m_log.log("Exit code " + std::to_string(code),
              runner_config.is_success(code) ? Severity::Info : Severity::Error, kSource);
    return code;
}

} // namespace odtdeploy
