/**
 * @file exit_codes.hpp
 * @brief Process exit codes reserved by odtdeploy.
 *
 * @details
 * Codes in the 60000 range are reserved for failures detected by odtdeploy
 * itself. Any other non-zero code returned by a run is the exit code of an
 * external process (legacy removal script or the Office setup executable).
 */
#pragma once

namespace odtdeploy
{

constexpr int kExitSuccess = 0;

/// Returned by the Office setup executable when a restart is pending.
constexpr int kExitRebootRequired = 3010;

/// Unexpected exception in the deployment body.
constexpr int kExitUnexpectedError = 60001;

/// An external process could not be started.
constexpr int kExitProcessLaunchFailed = 60002;

/// Support files or the setup executable are missing.
constexpr int kExitBootstrapFailure = 60008;

/// Invalid command line or configuration file.
constexpr int kExitInvalidArguments = 60010;

} // namespace odtdeploy
