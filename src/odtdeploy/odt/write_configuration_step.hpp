/**
 * @file write_configuration_step.hpp
 * @brief WriteConfigurationStep writes the ODT document before setup runs.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/execution/step.hpp"
#include "odtdeploy/odt/odt_configuration.hpp"

namespace odtdeploy
{

/**
 * @brief Step that replaces the ODT configuration document.
 *
 * @details
 * Returns 0 once the document is written. A write failure throws, which
 * stops the run before the installer is started.
 */
class WriteConfigurationStep : public IStep
{
public:
    WriteConfigurationStep(OdtConfiguration configuration, std::string path);

    int execute() override;

    StepRole role() const override
    {
        return StepRole::Preparation;
    }

    const std::string& class_name() const override;

    std::string friendly_name() const override
    {
        return "Write configuration";
    }

    std::string describe() const override
    {
        return std::string(to_string(m_configuration.action)) + " " +
            std::to_string(m_configuration.products.size()) + " product(s) -> " + m_path;
    }

    const OdtConfiguration& configuration() const noexcept
    {
        return m_configuration;
    }

    const std::string& path() const noexcept
    {
        return m_path;
    }

private:
    OdtConfiguration m_configuration;
    std::string m_path;
};

} // namespace odtdeploy
