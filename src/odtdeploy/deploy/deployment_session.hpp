/**
 * @file deployment_session.hpp
 * @brief DeploymentSession runs one deployment request end to end.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/deploy/deployment_plan.hpp"
#include "odtdeploy/execution/run_result.hpp"
#include "odtdeploy/execution/step_runner.hpp"

namespace odtdeploy
{

/**
 * @brief Derive the exit code of a run from its step outcomes.
 *
 * @details
 * Starts at 0. Every failed step sets the code to its own exit code; the
 * terminal step, if it ran, sets the code to its exit code whatever it is.
 */
int final_exit_code(const RunResult& result);

/**
 * @brief Log file name for a request: `odtdeploy_<product>_<type>.log`.
 */
std::string log_file_name(const DeploymentRequest& request);

/**
 * @brief Runs deployment requests.
 *
 * @details
 * A run checks that the support files and the setup executable are present,
 * builds the plan, runs its steps in order and derives the exit code:
 * - missing support files or setup executable: kExitBootstrapFailure,
 *   before the inventory is read or any process runs;
 * - any exception in planning or in a step: kExitUnexpectedError;
 * - otherwise final_exit_code() of the step outcomes.
 *
 * @par Thread Safety
 * - Not thread-safe. One run at a time.
 */
class DeploymentSession
{
public:
    DeploymentSession(
        DeploymentConfig config,
        IInventorySource& inventory_source,
        IInstalledApplications& installed_applications,
        IProcessRunner& process_runner,
        DeployLog& log);

    /**
     * @brief Run a request.
     * @return The exit code of the run. Never throws.
     */
    int run(const DeploymentRequest& request);

    /**
     * @brief Build the plan for a request without running it.
     * @throws DeploymentError as DeploymentPlanner::plan().
     */
    DeploymentPlan plan(const DeploymentRequest& request);

    /**
     * @brief Check the support-files directory and the setup executable.
     * @param missing Receives a description of what is missing.
     * @return True if both are present.
     */
    bool check_bootstrap(std::string& missing) const;

    const DeploymentConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Result of the last executed plan.
     */
    const RunResult& last_result() const noexcept
    {
        return m_last_result;
    }

private:
    int run_unguarded(const DeploymentRequest& request);

    DeploymentConfig m_config;
    DeployLog& m_log;
    DeploymentPlanner m_planner;
    RunResult m_last_result;
};

} // namespace odtdeploy
