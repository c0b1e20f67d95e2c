#include "odtdeploy/execution/process_step.hpp"
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/common/exit_codes.hpp"

namespace odtdeploy
{

ProcessStep::ProcessStep(
    std::string name,
    StepRole role,
    ProcessCommand command,
    IProcessRunner& runner,
    DeployLog* log)
    : m_name{std::move(name)}
    , m_role{role}
    , m_command{std::move(command)}
    , m_runner{runner}
    , m_log{log}
{}

int ProcessStep::execute()
{
    try
    {
        return m_runner.run(m_command);
    }
    catch (const DeploymentError& e)
    {
        if (e.code() != DeploymentErrorCode::ProcessLaunchFailed)
        {
            throw;
        }
        m_launch_error = e.what();
        if (m_log)
        {
            m_log->error(m_name, m_launch_error);
        }
        return kExitProcessLaunchFailed;
    }
}

const std::string& ProcessStep::class_name() const
{
    static const std::string name = "ProcessStep";
    return name;
}

} // namespace odtdeploy
