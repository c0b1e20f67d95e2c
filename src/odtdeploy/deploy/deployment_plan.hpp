/**
 * @file deployment_plan.hpp
 * @brief DeploymentPlan and DeploymentPlanner.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/config/deployment_config.hpp"
#include "odtdeploy/execution/process_runner.hpp"
#include "odtdeploy/execution/step.hpp"
#include "odtdeploy/inventory/installed_applications.hpp"
#include "odtdeploy/inventory/inventory_source.hpp"
#include "odtdeploy/legacy/legacy_office.hpp"
#include "odtdeploy/odt/odt_configuration.hpp"
#include "odtdeploy/reconcile/edition_reconciler.hpp"

namespace odtdeploy
{

/**
 * @brief Everything a run will do, computed before any step executes.
 *
 * @details
 * Install plans contain, in order: one removal step per detected legacy
 * version (ascending release year), the Click-to-Run removal step when
 * required, the configuration write, and the setup call. Uninstall plans
 * contain the configuration write and the setup call.
 */
struct DeploymentPlan
{
    DeploymentRequest request;

    /**
     * @brief Inventory read at plan time; install plans only.
     */
    std::optional<InstalledInventory> inventory;

    /**
     * @brief Reconciliation outcome; install plans only.
     */
    std::optional<ReconcileResult> reconciled;

    std::set<LegacyVersion> legacy_versions;

    bool remove_click_to_run{false};

    OdtConfiguration configuration;

    std::vector<StepPtr> steps;

    /**
     * @brief Multi-line human-readable rendering.
     */
    std::string describe() const;
};

/**
 * @brief Builds deployment plans from a request and the machine state.
 *
 * @details
 * The planner reads the inventory and the installed applications but runs
 * nothing: the steps it produces hold references to the process runner and
 * execute only when handed to a step runner.
 */
class DeploymentPlanner
{
public:
    DeploymentPlanner(
        const DeploymentConfig& config,
        IInventorySource& inventory_source,
        IInstalledApplications& installed_applications,
        IProcessRunner& process_runner,
        DeployLog& log);

    /**
     * @brief Build the plan for a request.
     * @throws DeploymentError if the machine state cannot be read or a
     *         required product key is missing.
     */
    DeploymentPlan plan(const DeploymentRequest& request);

    /**
     * @brief Settings of the generated ODT document for a request.
     */
    OdtSettings odt_settings(const DeploymentRequest& request) const;

    /**
     * @brief Command running the Office setup executable with the document.
     */
    ProcessCommand setup_command() const;

    RemovalContext removal_context() const;

private:
    void plan_install(DeploymentPlan& plan);
    void plan_uninstall(DeploymentPlan& plan);
    void append_setup_steps(DeploymentPlan& plan);

    const DeploymentConfig& m_config;
    IInventorySource& m_inventory_source;
    IInstalledApplications& m_installed_applications;
    IProcessRunner& m_process_runner;
    DeployLog& m_log;
};

} // namespace odtdeploy
