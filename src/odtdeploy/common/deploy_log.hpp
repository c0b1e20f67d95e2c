/**
 * @file deploy_log.hpp
 * @brief DeployLog, the run-wide log sink.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include <fstream>

namespace odtdeploy
{

/**
 * @brief Log entry severity.
 *
 * @details
 * Numeric values follow the deployment toolkit convention: 1 information,
 * 2 warning, 3 error.
 */
enum class Severity
{
    Info = 1,
    Warning = 2,
    Error = 3
};

const char* to_string(Severity severity) noexcept;

/**
 * @brief Line-oriented deployment log.
 *
 * @details
 * Each entry is formatted as
 * `[<date> <time>] [<source>] [<severity>] :: <message>` and written to the
 * console stream (if any) and appended to the log file (if one is open).
 *
 * @par Thread Safety
 * - Not thread-safe. A run is single-threaded.
 */
class DeployLog
{
public:
    /**
     * @brief Construct a log writing to a console stream only.
     * @param console Stream receiving every entry; may be nullptr.
     */
    explicit DeployLog(std::ostream* console = &std::clog);

    DeployLog(const DeployLog&) = delete;
    DeployLog& operator=(const DeployLog&) = delete;

    /**
     * @brief Open (append) a log file in addition to the console stream.
     * @return False if the file could not be opened; console logging continues.
     */
    bool open_file(const std::string& path);

    /**
     * @brief Write one entry.
     * @param message Message text.
     * @param severity Entry severity.
     * @param source Short name of the component writing the entry.
     */
    void log(const std::string& message, Severity severity, const std::string& source);

    void info(const std::string& source, const std::string& message)
    {
        log(message, Severity::Info, source);
    }

    void warning(const std::string& source, const std::string& message)
    {
        log(message, Severity::Warning, source);
    }

    void error(const std::string& source, const std::string& message)
    {
        log(message, Severity::Error, source);
    }

    /**
     * @brief Number of entries written at the given severity.
     */
    size_t count(Severity severity) const noexcept;

    const std::string& file_path() const noexcept
    {
        return m_file_path;
    }

private:
    std::ostream* m_console;
    std::ofstream m_file;
    std::string m_file_path;
    std::array<size_t, 3> m_counts{{0, 0, 0}};
};

} // namespace odtdeploy
