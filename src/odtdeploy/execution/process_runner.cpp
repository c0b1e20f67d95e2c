#include "odtdeploy/execution/process_runner.hpp"
#include "odtdeploy/common/deployment_errors.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace odtdeploy
{

namespace
{

// Quoting as parsed by CommandLineToArgvW and the MSVC runtime: backslashes
// are literal unless they precede a quote, so those runs are doubled.
std::string quote_arg(const std::string& arg)
{
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos)
    {
        return arg;
    }

    std::string result = "\"";
    size_t backslashes = 0;
    for (char c : arg)
    {
        if (c == '\\')
        {
            ++backslashes;
            continue;
        }
        if (c == '"')
        {
            result.append(backslashes * 2 + 1, '\\');
        }
        else
        {
            result.append(backslashes, '\\');
        }
        backslashes = 0;
        result.push_back(c);
    }
    result.append(backslashes * 2, '\\');
    result.push_back('"');
    return result;
}

} // namespace

std::string ProcessCommand::command_line() const
{
    std::string result = quote_arg(path);
    for (const auto& arg : args)
    {
        result += " ";
        result += quote_arg(arg);
    }
    return result;
}

int SystemProcessRunner::run(const ProcessCommand& command)
{
#ifdef _WIN32
    std::string cmd = command.command_line();
    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    ZeroMemory(&pi, sizeof(pi));
    si.cb = sizeof(si);
    if (!CreateProcessA(NULL,
                        &cmd[0],
                        NULL,
                        NULL,
                        FALSE,
                        CREATE_NO_WINDOW,
                        NULL,
                        command.working_dir.empty() ? NULL : command.working_dir.c_str(),
                        &si,
                        &pi))
    {
        throw DeploymentError(DeploymentErrorCode::ProcessLaunchFailed,
            "CreateProcess failed (error " + std::to_string(GetLastError()) + "): " + cmd);
    }
    CloseHandle(pi.hThread);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD code = 1;
    BOOL ok = GetExitCodeProcess(pi.hProcess, &code);
    CloseHandle(pi.hProcess);
    if (!ok)
    {
        throw DeploymentError(DeploymentErrorCode::ProcessLaunchFailed,
            "GetExitCodeProcess failed: " + cmd);
    }
    return static_cast<int>(code);
#else
    // The child reports an exec failure through this pipe; a successful exec
    // closes it (FD_CLOEXEC) without writing.
    int fds[2];
    if (pipe(fds) != 0)
    {
        throw DeploymentError(DeploymentErrorCode::ProcessLaunchFailed,
            std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.path.c_str()));
    for (const auto& arg : command.args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw DeploymentError(DeploymentErrorCode::ProcessLaunchFailed,
            std::string("fork failed: ") + std::strerror(err));
    }
    if (pid == 0)
    {
        close(fds[0]);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        if (!command.working_dir.empty() && chdir(command.working_dir.c_str()) != 0)
        {
            int err = errno;
            ssize_t ignored = write(fds[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        execvp(command.path.c_str(), &argv[0]);
        int err = errno;
        ssize_t ignored = write(fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(fds[1]);
    int child_errno = 0;
    ssize_t n;
    do
    {
        n = read(fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(fds[0]);

    int status = 0;
    pid_t waited;
    do
    {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        throw DeploymentError(DeploymentErrorCode::ProcessLaunchFailed,
            "Failed to start " + command.command_line() + ": " + std::strerror(child_errno));
    }
    if (waited < 0)
    {
        throw DeploymentError(DeploymentErrorCode::ProcessLaunchFailed,
            std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    return -1;
#endif
}

} // namespace odtdeploy
