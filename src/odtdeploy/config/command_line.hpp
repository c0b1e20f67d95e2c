/**
 * @file command_line.hpp
 * @brief odtdeploy command-line options.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/config/deployment_config.hpp"

namespace odtdeploy
{

struct CommandLine
{
    DeploymentRequest request;

    /// Path given with --config; empty for the built-in defaults.
    std::string config_path;

    bool plan_only{false};
    bool help{false};
};

/**
 * @brief Parse the arguments that follow the program name.
 *
 * @details
 * `--product` is required unless `--help` is given. Later occurrences of an
 * option override earlier ones.
 *
 * @throws DeploymentError with code InvalidArgument for an unknown option, a
 *         missing option value, an unknown type or mode, or a missing
 *         `--product`; with code InvalidProduct for a product outside the
 *         catalog.
 */
CommandLine parse_command_line(const std::vector<std::string>& args);

/**
 * @brief Usage text listing every option.
 */
std::string usage_text();

} // namespace odtdeploy
