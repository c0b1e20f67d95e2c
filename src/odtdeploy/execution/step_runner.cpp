#include "odtdeploy/execution/step_runner.hpp"

namespace odtdeploy
{

namespace
{

const std::string kSource = "StepRunner";

} // namespace

SequentialStepRunner::SequentialStepRunner(StepRunnerConfig config, DeployLog* log)
    : m_config{std::move(config)}
    , m_log{log}
{}

void SequentialStepRunner::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool SequentialStepRunner::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

RunResult SequentialStepRunner::run(const std::vector<StepPtr>& steps)
{
    RunResult result;
    auto start_time = std::chrono::steady_clock::now();

    result.outcomes.reserve(steps.size());

    for (StepIdx idx = 0; idx < steps.size(); ++idx)
    {
        if (stop_requested())
        {
            StepOutcome cancelled;
            cancelled.step_idx = idx;
            cancelled.name = steps[idx]->friendly_name();
            cancelled.role = steps[idx]->role();
            cancelled.state = StepState::Cancelled;
            result.outcomes.push_back(std::move(cancelled));
            continue;
        }

        StepOutcome outcome = run_step(idx, *steps[idx]);

        if (outcome.state == StepState::Failed && m_config.abort_on_failure)
        {
            request_stop();
        }
        if (outcome.state == StepState::Faulted && m_config.abort_on_fault)
        {
            request_stop();
        }
        result.outcomes.push_back(std::move(outcome));
    }

    auto end_time = std::chrono::steady_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        end_time - start_time);

    result.stopped = result.count(StepState::Cancelled) > 0;
    result.success = result.count(StepState::Succeeded) == steps.size();

    if (m_log)
    {
        m_log->log(result.summary(),
                   result.success ? Severity::Info : Severity::Warning, kSource);
    }
    return result;
}

StepOutcome SequentialStepRunner::run_step(StepIdx idx, IStep& step)
{
    StepOutcome outcome;
    outcome.step_idx = idx;
    outcome.name = step.friendly_name();
    outcome.role = step.role();

    if (m_log)
    {
        m_log->info(kSource, "[" + std::to_string(idx + 1) + "] " + outcome.name + ": " +
            step.describe());
    }

    auto start_time = std::chrono::steady_clock::now();

    try
    {
        outcome.exit_code = step.execute();
        outcome.state = m_config.is_success(outcome.exit_code)
            ? StepState::Succeeded
            : StepState::Failed;
    }
    catch (const std::exception& e)
    {
        outcome.exception = std::current_exception();
        outcome.error_message = e.what();
        outcome.state = StepState::Faulted;
    }
    catch (...)
    {
        outcome.exception = std::current_exception();
        outcome.error_message = "Unknown exception";
        outcome.state = StepState::Faulted;
    }

    auto end_time = std::chrono::steady_clock::now();
    outcome.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);

    if (m_log)
    {
        switch (outcome.state)
        {
            case StepState::Succeeded:
                m_log->info(kSource, outcome.name + " completed with exit code " +
                    std::to_string(outcome.exit_code));
                break;
            case StepState::Failed:
                m_log->error(kSource, outcome.name + " failed with exit code " +
                    std::to_string(outcome.exit_code));
                break;
            case StepState::Faulted:
                m_log->error(kSource, outcome.name + " raised an error: " + outcome.error_message);
                break;
            case StepState::NotRun:
            case StepState::Cancelled:
                break;
        }
    }
    return outcome;
}

} // namespace odtdeploy
