#include "odtdeploy/deploy/deployment_plan.hpp"
#include "odtdeploy/execution/process_step.hpp"
#include "odtdeploy/odt/write_configuration_step.hpp"

namespace odtdeploy
{

namespace
{

const std::string kSource = "Planner";

} // namespace

std::string DeploymentPlan::describe() const
{
    std::string text;
    text += std::string("Deployment: ") + to_string(request.type) + " " +
        to_string(request.product) + " (" + to_string(request.mode) + ")\n";
    if (inventory)
    {
        text += "Installed: " + inventory->summary() + "\n";
    }
    if (reconciled)
    {
        text += "Reconciled: " + reconciled->summary() + "\n";
    }
    if (!legacy_versions.empty())
    {
        text += "Legacy versions:";
        for (LegacyVersion version : legacy_versions)
        {
            text += std::string(" ") + to_string(version);
        }
        text += "\n";
    }
    text += std::string("Remove Click-to-Run: ") + (remove_click_to_run ? "yes" : "no") + "\n";
    text += "Steps:\n";
    for (size_t i = 0; i < steps.size(); ++i)
    {
        text += "  " + std::to_string(i + 1) + ". [" + to_string(steps[i]->role()) + "] " +
            steps[i]->friendly_name() + ": " + steps[i]->describe() + "\n";
    }
    text += "Configuration:\n" + to_xml(configuration);
    return text;
}

DeploymentPlanner::DeploymentPlanner(
    const DeploymentConfig& config,
    IInventorySource& inventory_source,
    IInstalledApplications& installed_applications,
    IProcessRunner& process_runner,
    DeployLog& log)
    : m_config{config}
    , m_inventory_source{inventory_source}
    , m_installed_applications{installed_applications}
    , m_process_runner{process_runner}
    , m_log{log}
{}

DeploymentPlan DeploymentPlanner::plan(const DeploymentRequest& request)
{
    DeploymentPlan plan;
    plan.request = request;

    if (request.type == DeploymentType::Install)
    {
        plan_install(plan);
    }
    else
    {
        plan_uninstall(plan);
    }
    append_setup_steps(plan);
    return plan;
}

OdtSettings DeploymentPlanner::odt_settings(const DeploymentRequest& request) const
{
    OdtSettings settings;
    settings.platform = m_config.platform;
    settings.channel = m_config.channel;
    settings.language = m_config.language;
    settings.display_level = request.mode == DeployMode::Interactive
        ? DisplayLevel::Full
        : DisplayLevel::None;
    settings.logging_path = m_config.log_dir;
    settings.force_app_shutdown = m_config.force_app_shutdown;
    settings.product_keys = m_config.product_keys;
    return settings;
}

ProcessCommand DeploymentPlanner::setup_command() const
{
    ProcessCommand command;
    command.path = m_config.setup_path;
    command.args = {"/configure", m_config.configuration_file};
    return command;
}

RemovalContext DeploymentPlanner::removal_context() const
{
    RemovalContext context;
    context.support_files_dir = m_config.support_files_dir;
    context.log_dir = m_config.log_dir;
    context.script_host = m_config.script_host;
    return context;
}

void DeploymentPlanner::plan_install(DeploymentPlan& plan)
{
    plan.inventory = m_inventory_source.read_inventory();

    DeploymentTarget target;
    target.requested = plan.request.product;
    target.platform = m_config.platform;
    target.channel_url = update_channel_info(m_config.channel).cdn_base_url;

    plan.reconciled = reconcile(target, *plan.inventory);
    m_log.info(kSource, "Reconciled products: " + plan.reconciled->summary());
    for (ProductId migrated : plan.reconciled->migrated_products)
    {
        m_log.info(kSource, std::string("Migrating ") + to_string(migrated) + " to " +
            to_string(target.requested));
    }
    if (plan.reconciled->platform_migration)
    {
        m_log.info(kSource, std::string("Platform migration from ") +
            to_string(*plan.inventory->platform) + " to " + to_string(target.platform));
    }
    if (plan.reconciled->channel_migration)
    {
        m_log.info(kSource, "Channel migration from " + plan.inventory->channel_url +
            " to " + to_string(m_config.channel));
    }

    plan.legacy_versions = detect_legacy(m_installed_applications.display_names());
    for (LegacyVersion version : plan.legacy_versions)
    {
        m_log.info(kSource, std::string("Detected legacy ") + legacy_version_info(version).label);
    }

    RemovalContext context = removal_context();
    for (auto& step : legacy_removal_steps(plan.legacy_versions, context, m_process_runner, &m_log))
    {
        plan.steps.push_back(std::move(step));
    }

    plan.remove_click_to_run = should_remove_click_to_run(!plan.legacy_versions.empty(), *plan.reconciled);
    if (plan.remove_click_to_run)
    {
        plan.steps.push_back(std::make_shared<ProcessStep>(
            "Remove Click-to-Run Office",
            StepRole::ClickToRunRemoval,
            click_to_run_removal_command(context),
            m_process_runner,
            &m_log));
    }

    plan.configuration = make_install_configuration(
        plan.reconciled->target_set, plan.request.product, odt_settings(plan.request), m_log);
}

void DeploymentPlanner::plan_uninstall(DeploymentPlan& plan)
{
    plan.configuration = make_uninstall_configuration(plan.request.product, odt_settings(plan.request));
}

void DeploymentPlanner::append_setup_steps(DeploymentPlan& plan)
{
    plan.steps.push_back(std::make_shared<WriteConfigurationStep>(
        plan.configuration, m_config.configuration_file));

    std::string name = plan.request.type == DeploymentType::Install
        ? "Install Office"
        : "Uninstall Office";
    plan.steps.push_back(std::make_shared<ProcessStep>(
        name, StepRole::Terminal, setup_command(), m_process_runner, &m_log));
}

} // namespace odtdeploy
