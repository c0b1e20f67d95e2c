/**
 * @file process_step.hpp
 * @brief ProcessStep runs one external command.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/execution/process_runner.hpp"
#include "odtdeploy/execution/step.hpp"

namespace odtdeploy
{

/**
 * @brief Step that runs one external command through an IProcessRunner.
 *
 * @details
 * A command that cannot be started is not an unexpected failure: it is
 * reported as exit code kExitProcessLaunchFailed, so the run treats it like
 * any other failing process.
 */
class ProcessStep : public IStep
{
public:
    ProcessStep(
        std::string name,
        StepRole role,
        ProcessCommand command,
        IProcessRunner& runner,
        DeployLog* log = nullptr);

    int execute() override;

    StepRole role() const override
    {
        return m_role;
    }

    const std::string& class_name() const override;

    std::string friendly_name() const override
    {
        return m_name;
    }

    std::string describe() const override
    {
        return m_command.command_line();
    }

    const ProcessCommand& command() const noexcept
    {
        return m_command;
    }

    /**
     * @brief Error text of the last launch failure, if any.
     */
    const std::string& launch_error() const noexcept
    {
        return m_launch_error;
    }

private:
    std::string m_name;
    StepRole m_role;
    ProcessCommand m_command;
    IProcessRunner& m_runner;
    DeployLog* m_log;
    std::string m_launch_error;
};

} // namespace odtdeploy
