#include "odtdeploy/odt/write_configuration_step.hpp"

namespace odtdeploy
{

WriteConfigurationStep::WriteConfigurationStep(OdtConfiguration configuration, std::string path)
    : m_configuration{std::move(configuration)}
    , m_path{std::move(path)}
{}

int WriteConfigurationStep::execute()
{
    write_configuration(m_configuration, m_path);
    return 0;
}

const std::string& WriteConfigurationStep::class_name() const
{
    static const std::string name = "WriteConfigurationStep";
    return name;
}

} // namespace odtdeploy
