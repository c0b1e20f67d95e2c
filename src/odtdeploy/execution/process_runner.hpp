/**
 * @file process_runner.hpp
 * @brief Synchronous external process execution.
 */
#pragma once
#include "odtdeploy/common/common.hpp"

namespace odtdeploy
{

/**
 * @brief An external command: executable path, arguments, working directory.
 */
struct ProcessCommand
{
    std::string path;
    std::vector<std::string> args;

    /**
     * @brief Working directory; empty means the current directory.
     */
    std::string working_dir;

    /**
     * @brief Render as a single command line.
     *
     * @details
     * Arguments are quoted and escaped the way CommandLineToArgvW splits them,
     * so on Windows this string is passed to CreateProcess as is. On POSIX it
     * is used for logging only.
     */
    std::string command_line() const;
};

/**
 * @brief Interface for running an external command to completion.
 *
 * @details
 * run() blocks until the process exits. No timeout is applied.
 */
class IProcessRunner
{
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run a command and wait for it.
     * @param command The command to run.
     * @return The process exit code.
     * @throws DeploymentError with code ProcessLaunchFailed if the process
     *         could not be started or waited upon.
     */
    virtual int run(const ProcessCommand& command) = 0;
};

/**
 * @brief IProcessRunner backed by the operating system.
 *
 * @details
 * Uses CreateProcess/WaitForSingleObject on Windows and fork/execvp/waitpid
 * elsewhere. A process killed by a signal reports exit code -1.
 */
class SystemProcessRunner : public IProcessRunner
{
public:
    int run(const ProcessCommand& command) override;
};

} // namespace odtdeploy
