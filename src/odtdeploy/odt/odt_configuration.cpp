#include "odtdeploy/odt/odt_configuration.hpp"
#include "odtdeploy/common/deployment_errors.hpp"
#include <filesystem>
#include <tinyxml2.h>

namespace odtdeploy
{

namespace
{

const std::string kSource = "OdtConfiguration";

void build_document(const OdtConfiguration& configuration, tinyxml2::XMLDocument& doc)
{
    const OdtSettings& settings = configuration.settings;

    tinyxml2::XMLElement* root = doc.NewElement("Configuration");
    doc.InsertEndChild(root);

    tinyxml2::XMLElement* directive = doc.NewElement(to_string(configuration.action));
    if (configuration.action == OdtAction::Add)
    {
        directive->SetAttribute("OfficeClientEdition", office_client_edition(settings.platform));
        if (settings.channel)
        {
            directive->SetAttribute("Channel", to_string(*settings.channel));
        }
    }
    root->InsertEndChild(directive);

    for (const auto& product : configuration.products)
    {
        tinyxml2::XMLElement* element = doc.NewElement("Product");
        element->SetAttribute("ID", to_string(product.id));
        if (!product.pid_key.empty())
        {
            element->SetAttribute("PIDKEY", product.pid_key.c_str());
        }
        tinyxml2::XMLElement* language = doc.NewElement("Language");
        language->SetAttribute("ID", settings.language.c_str());
        element->InsertEndChild(language);
        directive->InsertEndChild(element);
    }

    tinyxml2::XMLElement* display = doc.NewElement("Display");
    display->SetAttribute("Level", to_string(settings.display_level));
    display->SetAttribute("AcceptEULA", "TRUE");
    root->InsertEndChild(display);

    tinyxml2::XMLElement* logging = doc.NewElement("Logging");
    logging->SetAttribute("Level", "Standard");
    if (!settings.logging_path.empty())
    {
        logging->SetAttribute("Path", settings.logging_path.c_str());
    }
    root->InsertEndChild(logging);

    tinyxml2::XMLElement* shutdown = doc.NewElement("Property");
    shutdown->SetAttribute("Name", "FORCEAPPSHUTDOWN");
    shutdown->SetAttribute("Value", settings.force_app_shutdown ? "TRUE" : "FALSE");
    root->InsertEndChild(shutdown);
}

} // namespace

const char* to_string(OdtAction action) noexcept
{
    return action == OdtAction::Add ? "Add" : "Remove";
}

const char* to_string(DisplayLevel level) noexcept
{
    return level == DisplayLevel::Full ? "Full" : "None";
}

OdtConfiguration make_install_configuration(
    const std::vector<ProductId>& products,
    ProductId requested,
    const OdtSettings& settings,
    DeployLog& log)
{
    OdtConfiguration configuration;
    configuration.action = OdtAction::Add;
    configuration.settings = settings;

    for (ProductId id : products)
    {
        OdtProduct product{id, std::string()};
        if (product_info(id).requires_product_key())
        {
            auto it = settings.product_keys.find(id);
            if (it != settings.product_keys.end() && !it->second.empty())
            {
                product.pid_key = it->second;
            }
            else if (id == requested)
            {
                throw DeploymentError(DeploymentErrorCode::MissingProductKey,
                    std::string("No product key configured for ") + to_string(id));
            }
            else
            {
                log.warning(kSource, std::string("No product key configured for preserved product ") +
                    to_string(id) + "; PIDKEY omitted");
            }
        }
        configuration.products.push_back(std::move(product));
    }
    return configuration;
}

OdtConfiguration make_uninstall_configuration(ProductId requested, const OdtSettings& settings)
{
    OdtConfiguration configuration;
    configuration.action = OdtAction::Remove;
    configuration.settings = settings;
    configuration.products.push_back(OdtProduct{requested, std::string()});
    return configuration;
}

std::string to_xml(const OdtConfiguration& configuration)
{
    tinyxml2::XMLDocument doc;
    build_document(configuration, doc);
    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return std::string(printer.CStr());
}

void write_configuration(const OdtConfiguration& configuration, const std::string& path)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
    {
        throw DeploymentError(DeploymentErrorCode::ConfigurationWriteFailed,
            "Failed to delete previous configuration " + path + ": " + ec.message());
    }

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
    {
        fs::create_directories(parent, ec);
        if (ec)
        {
            throw DeploymentError(DeploymentErrorCode::ConfigurationWriteFailed,
                "Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    tinyxml2::XMLDocument doc;
    build_document(configuration, doc);
    if (doc.SaveFile(path.c_str()) != tinyxml2::XML_SUCCESS)
    {
        throw DeploymentError(DeploymentErrorCode::ConfigurationWriteFailed,
            "Failed to write configuration " + path + ": " + doc.ErrorStr());
    }
}

} // namespace odtdeploy
