/**
 * @file step.hpp
 * @brief IStep interface for deployment steps.
 */
#pragma once
#include "odtdeploy/common/common.hpp"

namespace odtdeploy
{

/**
 * @brief Role of a step within a deployment plan.
 *
 * @details
 * The exit code of the `Terminal` step (the installer or uninstaller call)
 * becomes the exit code of the run. Other steps only contribute their exit
 * code when they fail.
 */
enum class StepRole
{
    Preparation,
    LegacyRemoval,
    ClickToRunRemoval,
    Terminal
};

const char* to_string(StepRole role) noexcept;

/**
 * @brief Interface for executable steps in a deployment plan.
 *
 * @details
 * IStep represents a unit of work in a deployment: running one external
 * process, or writing one file. Steps are executed in plan order by a step
 * runner on the calling thread.
 *
 * @par Lifecycle
 * - Created by the deployment planner.
 * - execute() called at most once by the step runner.
 * - Object lifetime managed via shared_ptr.
 */
class IStep
{
public:
    virtual ~IStep() = 0;

    /**
     * @brief Execute this step's work.
     *
     * @return The step's exit code. Whether it counts as success is decided by
     *         the runner's configured success codes.
     *
     * @throws Any exception to indicate an unexpected failure. The runner
     *         records the exception and, by default, stops the run.
     */
    virtual int execute() = 0;

    /**
     * @brief Get the role of this step.
     */
    virtual StepRole role() const = 0;

    /**
     * @brief Get the class name for type identification.
     * @return Reference to static string with the implementation class name.
     */
    virtual const std::string& class_name() const = 0;

    /**
     * @brief Get a user-friendly display name for this step.
     */
    virtual std::string friendly_name() const = 0;

    /**
     * @brief Get a description of what the step will do, for plan output.
     */
    virtual std::string describe() const = 0;

protected:
    IStep() = default;

private:
    IStep(const IStep&) = delete;
    IStep(IStep&&) = delete;
    IStep& operator=(const IStep&) = delete;
    IStep& operator=(IStep&&) = delete;
};

using StepPtr = std::shared_ptr<IStep>;

inline IStep::~IStep() = default;

inline const char* to_string(StepRole role) noexcept
{
    switch (role)
    {
        case StepRole::Preparation:
            return "Preparation";
        case StepRole::LegacyRemoval:
            return "LegacyRemoval";
        case StepRole::ClickToRunRemoval:
            return "ClickToRunRemoval";
        case StepRole::Terminal:
            return "Terminal";
    }
    return "Unknown";
}

} // namespace odtdeploy
