/**
 * @file deployment_main.hpp
 * @brief Program entry: command line to exit code.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include <ostream>

namespace odtdeploy
{

/**
 * @brief Run odtdeploy with the arguments that follow the program name.
 *
 * @details
 * Invalid arguments, an unreadable or invalid configuration, and a
 * configuration that names no usable inventory source print the error and
 * the usage text to @p err and return kExitInvalidArguments. The log file is
 * opened only once those checks pass. Any other failure returns
 * kExitUnexpectedError.
 *
 * @param out  Receives the usage text and the `--plan` output.
 * @param err  Receives errors and console log lines.
 */
int run_deployment_main(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace odtdeploy
