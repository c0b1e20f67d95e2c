#include "odtdeploy/config/command_line.hpp"
#include "odtdeploy/common/deployment_errors.hpp"

namespace odtdeploy
{

namespace
{

[[noreturn]] void invalid_argument(const std::string& message)
{
    throw DeploymentError(DeploymentErrorCode::InvalidArgument, message);
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args)
{
    CommandLine cl;
    bool have_product = false;

    auto value_of = [&](size_t& i) -> const std::string& {
        if (i + 1 >= args.size())
        {
            invalid_argument("Missing value for " + args[i]);
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h")
        {
            cl.help = true;
        }
        else if (arg == "--plan")
        {
            cl.plan_only = true;
        }
        else if (arg == "--product")
        {
            cl.request.product = require_product_id(value_of(i));
            have_product = true;
        }
        else if (arg == "--type")
        {
            const std::string& value = value_of(i);
            auto type = parse_deployment_type(value);
            if (!type)
            {
                invalid_argument("Unknown deployment type: " + value);
            }
            cl.request.type = *type;
        }
        else if (arg == "--mode")
        {
            const std::string& value = value_of(i);
            auto mode = parse_deploy_mode(value);
            if (!mode)
            {
                invalid_argument("Unknown deploy mode: " + value);
            }
            cl.request.mode = *mode;
        }
        else if (arg == "--config")
        {
            cl.config_path = value_of(i);
        }
        else
        {
            invalid_argument("Unknown option: " + arg);
        }
    }

    if (!cl.help && !have_product)
    {
        invalid_argument("--product is required");
    }
    return cl;
}

std::string usage_text()
{
    return std::string("Usage: odtdeploy --product <id> [options]\n") +
        "\n"
        "Options:\n"
        "  --product <id>     Product edition: " + product_id_list() + "\n"
        "  --type <type>      install (default) | uninstall\n"
        "  --mode <mode>      interactive (default) | silent | noninteractive\n"
        "  --config <file>    Deployment configuration (XML)\n"
        "  --plan             Print the deployment plan and exit\n"
        "  --help             Show this help\n";
}

} // namespace odtdeploy
