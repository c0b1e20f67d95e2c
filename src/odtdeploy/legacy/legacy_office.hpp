/**
 * @file legacy_office.hpp
 * @brief Detection and removal of legacy MSI-based Office suites.
 */
#pragma once
#include "odtdeploy/common/common.hpp"
#include "odtdeploy/common/deploy_log.hpp"
#include "odtdeploy/execution/process_runner.hpp"
#include "odtdeploy/execution/step.hpp"
#include "odtdeploy/reconcile/edition_reconciler.hpp"

namespace odtdeploy
{

/**
 * @brief Legacy full-suite releases, in ascending release-year order.
 */
enum class LegacyVersion
{
    Office2003,
    Office2007,
    Office2010,
    Office2013,
    Office2016
};

/**
 * @brief Static description of one legacy release.
 */
struct LegacyVersionInfo
{
    LegacyVersion version;
    int release_year;

    /**
     * @brief Display-name label matched against installed applications.
     */
    const char* label;

    /**
     * @brief Removal script file name, relative to the support-files directory.
     */
    const char* removal_script;
};

constexpr std::array<LegacyVersionInfo, 5> kLegacyVersions{{
    {LegacyVersion::Office2003, 2003, "Microsoft Office Professional Edition 2003", "OffScrub03.vbs"},
    {LegacyVersion::Office2007, 2007, "Microsoft Office Professional Plus 2007", "OffScrub07.vbs"},
    {LegacyVersion::Office2010, 2010, "Microsoft Office Professional Plus 2010", "OffScrub10.vbs"},
    {LegacyVersion::Office2013, 2013, "Microsoft Office Professional Plus 2013", "OffScrub_O15msi.vbs"},
    {LegacyVersion::Office2016, 2016, "Microsoft Office Professional Plus 2016", "OffScrub_O16msi.vbs"},
}};

/// Removal script for an existing Click-to-Run installation.
constexpr const char* kClickToRunRemovalScript = "OffScrubc2r.vbs";

constexpr const LegacyVersionInfo& legacy_version_info(LegacyVersion version) noexcept
{
    return kLegacyVersions[static_cast<size_t>(version)];
}

/**
 * @brief Get a short tag for a legacy version (e.g. "Office2010").
 */
const char* to_string(LegacyVersion version) noexcept;

/**
 * @brief Where removal scripts live and how they are run.
 */
struct RemovalContext
{
    std::string support_files_dir;
    std::string log_dir;

    /**
     * @brief Script host executable running the .vbs removal scripts.
     */
    std::string script_host{"cscript.exe"};
};

/**
 * @brief Detect legacy suites among installed application display names.
 *
 * @details
 * Each display name is matched case-insensitively against every legacy
 * label (substring match). All matching versions are returned.
 */
std::set<LegacyVersion> detect_legacy(const std::vector<std::string>& display_names);

/**
 * @brief Build the command removing one legacy version.
 */
ProcessCommand legacy_removal_command(LegacyVersion version, const RemovalContext& context);

/**
 * @brief Build the command removing the existing Click-to-Run installation.
 */
ProcessCommand click_to_run_removal_command(const RemovalContext& context);

/**
 * @brief Build one removal step per version, in ascending release-year order.
 */
std::vector<StepPtr> legacy_removal_steps(
    const std::set<LegacyVersion>& versions,
    const RemovalContext& context,
    IProcessRunner& runner,
    DeployLog* log = nullptr);

/**
 * @brief Remove legacy versions one after another.
 *
 * @details
 * Every version is attempted, whatever the outcome of the previous ones.
 * A script that cannot be started records kExitProcessLaunchFailed; an
 * unexpected error records kExitUnexpectedError.
 *
 * @return Exit code per version.
 */
std::map<LegacyVersion, int> remove_legacy(
    const std::set<LegacyVersion>& versions,
    const RemovalContext& context,
    IProcessRunner& runner,
    DeployLog& log);

/**
 * @brief Decide whether the existing Click-to-Run installation must be removed.
 *
 * @return True if a legacy removal occurred, or a channel migration or a
 *         platform migration was flagged.
 */
bool should_remove_click_to_run(bool legacy_removed, const ReconcileResult& reconciled) noexcept;

} // namespace odtdeploy
