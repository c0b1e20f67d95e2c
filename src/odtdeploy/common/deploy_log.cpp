#include "odtdeploy/common/deploy_log.hpp"
#include <ctime>

namespace odtdeploy
{

namespace
{

std::string timestamp_now()
{
    char buf[32];
    std::time_t t = std::time(nullptr);
    struct tm tmv;
#ifdef _WIN32
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

} // namespace

const char* to_string(Severity severity) noexcept
{
    switch (severity)
    {
        case Severity::Info:
            return "Info";
        case Severity::Warning:
            return "Warning";
        case Severity::Error:
            return "Error";
    }
    return "Unknown";
}

DeployLog::DeployLog(std::ostream* console)
    : m_console{console}
{}

bool DeployLog::open_file(const std::string& path)
{
    if (m_file.is_open())
    {
        m_file.close();
    }
    m_file.open(path, std::ios::out | std::ios::app);
    if (!m_file.is_open())
    {
        m_file_path.clear();
        return false;
    }
    m_file_path = path;
    return true;
}

void DeployLog::log(const std::string& message, Severity severity, const std::string& source)
{
    m_counts[static_cast<size_t>(severity) - 1]++;

    std::string line = "[" + timestamp_now() + "] [" + source + "] [" +
        to_string(severity) + "] :: " + message;

    if (m_console)
    {
        *m_console << line << "\n" << std::flush;
    }
    if (m_file.is_open())
    {
        m_file << line << "\n" << std::flush;
    }
}

size_t DeployLog::count(Severity severity) const noexcept
{
    return m_counts[static_cast<size_t>(severity) - 1];
}

} // namespace odtdeploy
