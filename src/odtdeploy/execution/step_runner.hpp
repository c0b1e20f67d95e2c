/**
 * @file step_runner.hpp
 * @brief IStepRunner interface, StepRunnerConfig and SequentialStepRunner.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/execution/run_result.hpp"
#include "odtdeploy/execution/step.hpp"
#include <atomic>

namespace odtdeploy
{

/**
 * @brief Configuration for step runner behavior.
 */
struct StepRunnerConfig
{
    /**
     * @brief Exit codes that count as success.
     */
    std::vector<int> success_exit_codes{0, 3010};

    /**
     * @brief Whether a failing exit code stops the remaining steps.
     * @details Deployments continue past failed steps; each failure is
     *          isolated to its own step.
     */
    bool abort_on_failure{false};

    /**
     * @brief Whether an exception thrown by a step stops the remaining steps.
     */
    bool abort_on_fault{true};

    bool is_success(int exit_code) const
    {
        return std::find(success_exit_codes.begin(), success_exit_codes.end(), exit_code) !=
            success_exit_codes.end();
    }
};

/**
 * @brief Interface for step runners.
 *
 * @par Thread Safety
 * - run() must be called from one thread only.
 * - request_stop() may be called from any thread during a run.
 */
class IStepRunner
{
public:
    virtual ~IStepRunner() = default;

    /**
     * @brief Run steps in order.
     * @param steps The steps to run.
     * @return RunResult with one outcome per step.
     */
    virtual RunResult run(const std::vector<StepPtr>& steps) = 0;

    /**
     * @brief Request that no further step be started.
     *
     * @details
     * The step currently executing completes normally; pending steps are
     * cancelled. This is cooperative, not preemptive.
     */
    virtual void request_stop() = 0;

    virtual bool stop_requested() const noexcept = 0;
};

/**
 * @brief Runs steps one after another on the calling thread.
 *
 * @details
 * Each step is executed to completion before the next starts. Failed steps
 * are logged as errors; unless `abort_on_failure` is set the run continues.
 */
class SequentialStepRunner : public IStepRunner
{
public:
    /**
     * @brief Construct a sequential runner.
     * @param config Runner configuration.
     * @param log Log receiving one entry per step; may be nullptr.
     */
    explicit SequentialStepRunner(StepRunnerConfig config = {}, DeployLog* log = nullptr);

    RunResult run(const std::vector<StepPtr>& steps) override;

    void request_stop() override;

    bool stop_requested() const noexcept override;

    const StepRunnerConfig& config() const noexcept
    {
        return m_config;
    }

private:
    StepOutcome run_step(StepIdx idx, IStep& step);

    StepRunnerConfig m_config;
    DeployLog* m_log;
    std::atomic<bool> m_stop_requested{false};
};

} // namespace odtdeploy
