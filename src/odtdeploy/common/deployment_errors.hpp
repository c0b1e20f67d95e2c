/**
 * @file deployment_errors.hpp
 */
#pragma once
#include "odtdeploy/common/common.hpp"

namespace odtdeploy
{

/**
 * @brief Error codes for deployment operations.
 *
 * @note Each code maps to one stage of a run. The mapping from codes to
 * process exit codes is done by the caller (see exit_codes.hpp).
 */
enum class DeploymentErrorCode
{
    InvalidProduct,
    InvalidArgument,
    ConfigurationInvalid,
    MissingSupportFiles,
    InventoryUnavailable,
    MissingProductKey,
    ProcessLaunchFailed,
    ConfigurationWriteFailed
};

/**
 * @brief Get a short name for an error code, for log output.
 */
inline const char* to_string(DeploymentErrorCode code) noexcept
{
    switch (code)
    {
        case DeploymentErrorCode::InvalidProduct:
            return "InvalidProduct";
        case DeploymentErrorCode::InvalidArgument:
            return "InvalidArgument";
        case DeploymentErrorCode::ConfigurationInvalid:
            return "ConfigurationInvalid";
        case DeploymentErrorCode::MissingSupportFiles:
            return "MissingSupportFiles";
        case DeploymentErrorCode::InventoryUnavailable:
            return "InventoryUnavailable";
        case DeploymentErrorCode::MissingProductKey:
            return "MissingProductKey";
        case DeploymentErrorCode::ProcessLaunchFailed:
            return "ProcessLaunchFailed";
        case DeploymentErrorCode::ConfigurationWriteFailed:
            return "ConfigurationWriteFailed";
    }
    return "Unknown";
}

/**
 * @brief Exception class for deployment errors.
 *
 * @details
 * `DeploymentError` is thrown when a request or configuration is invalid, when
 * persisted system state cannot be read, or when an external process cannot be
 * started. Each exception carries an error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class DeploymentError : public std::exception
{
public:
    /**
     * @brief Construct a DeploymentError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    DeploymentError(DeploymentErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    DeploymentErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    DeploymentErrorCode m_code;
    std::string m_message;
};

} // namespace odtdeploy
