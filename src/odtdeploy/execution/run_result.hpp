/**
 * @file run_result.hpp
 * @brief Definition of RunResult returned by IStepRunner::run().
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/execution/step.hpp"

namespace odtdeploy
{

/**
 * @brief Type alias for step indices within a plan.
 */
using StepIdx = size_t;

/**
 * @brief Execution state of one step after a run.
 */
enum class StepState
{
    NotRun,
    Succeeded,
    Failed,
    Faulted,
    Cancelled
};

inline const char* to_string(StepState state) noexcept
{
    switch (state)
    {
        case StepState::NotRun:
            return "NotRun";
        case StepState::Succeeded:
            return "Succeeded";
        case StepState::Failed:
            return "Failed";
        case StepState::Faulted:
            return "Faulted";
        case StepState::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Outcome of one step.
 *
 * @par States
 * - `Succeeded`: execute() returned a success exit code.
 * - `Failed`: execute() returned any other exit code.
 * - `Faulted`: execute() threw; `error_message` holds what() and the
 *   exception is kept in `exception`.
 * - `Cancelled`: not executed because the run stopped earlier.
 */
struct StepOutcome
{
    StepIdx step_idx{0};
    std::string name;
    StepRole role{StepRole::Preparation};
    StepState state{StepState::NotRun};

    /**
     * @brief Exit code returned by execute(); meaningful for Succeeded/Failed.
     */
    int exit_code{0};

    std::string error_message;
    std::exception_ptr exception{};
    std::chrono::nanoseconds duration{0};

    bool ran() const noexcept
    {
        return state == StepState::Succeeded || state == StepState::Failed;
    }
};

/**
 * @brief Result of running a list of steps.
 *
 * @details
 * `outcomes` has one entry per step, in plan order, including steps that
 * never ran.
 */
struct RunResult
{
    /**
     * @brief Overall success status.
     * @details True if every step succeeded.
     */
    bool success{true};

    /**
     * @brief True if the run stopped before all steps were executed.
     */
    bool stopped{false};

    std::vector<StepOutcome> outcomes;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Get the first faulted step's outcome, if any.
     */
    const StepOutcome* first_fault() const noexcept
    {
        for (const auto& outcome : outcomes)
        {
            if (outcome.state == StepState::Faulted)
            {
                return &outcome;
            }
        }
        return nullptr;
    }

    /**
     * @brief Rethrow the first captured step exception, if any.
     */
    void rethrow_if_faulted() const
    {
        const StepOutcome* fault = first_fault();
        if (fault && fault->exception)
        {
            std::rethrow_exception(fault->exception);
        }
    }

    size_t count(StepState state) const noexcept
    {
        return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
            [state](const StepOutcome& o) { return o.state == state; }));
    }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success)
        {
            result = "Run succeeded";
        }
        else if (stopped)
        {
            result = "Run stopped";
        }
        else
        {
            result = "Run completed with failures";
        }
        result += " (succeeded=" + std::to_string(count(StepState::Succeeded));
        result += ", failed=" + std::to_string(count(StepState::Failed));
        result += ", faulted=" + std::to_string(count(StepState::Faulted));
        result += ", cancelled=" + std::to_string(count(StepState::Cancelled)) + ")";
        return result;
    }
};

} // namespace odtdeploy
