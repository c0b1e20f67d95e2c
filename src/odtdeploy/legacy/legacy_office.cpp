#include "odtdeploy/legacy/legacy_office.hpp"
#include "odtdeploy/common/exit_codes.hpp"
#include "odtdeploy/common/string_util.hpp"
#include "odtdeploy/execution/process_step.hpp"
#include "odtdeploy/execution/step_runner.hpp"
#include <filesystem>

namespace odtdeploy
{

namespace
{

const std::string kSource = "LegacyOffice";

constexpr bool legacy_versions_ascend()
{
    for (size_t i = 0; i < kLegacyVersions.size(); ++i)
    {
        if (static_cast<size_t>(kLegacyVersions[i].version) != i)
        {
            return false;
        }
        if (i > 0 && kLegacyVersions[i - 1].release_year >= kLegacyVersions[i].release_year)
        {
            return false;
        }
    }
    return true;
}

static_assert(legacy_versions_ascend(),
    "kLegacyVersions must be in LegacyVersion order and ascending by release year");

ProcessCommand script_command(const char* script, const RemovalContext& context)
{
    ProcessCommand command;
    command.path = context.script_host;
    command.args = {
        "//Nologo",
        (std::filesystem::path(context.support_files_dir) / script).string(),
        "ALL",
        "/Q",
        "/NoCancel",
        "/Log",
        context.log_dir,
    };
    return command;
}

} // namespace

const char* to_string(LegacyVersion version) noexcept
{
    switch (version)
    {
        case LegacyVersion::Office2003:
            return "Office2003";
        case LegacyVersion::Office2007:
            return "Office2007";
        case LegacyVersion::Office2010:
            return "Office2010";
        case LegacyVersion::Office2013:
            return "Office2013";
        case LegacyVersion::Office2016:
            return "Office2016";
    }
    return "Unknown";
}

std::set<LegacyVersion> detect_legacy(const std::vector<std::string>& display_names)
{
    std::set<LegacyVersion> found;
    for (const auto& name : display_names)
    {
        for (const auto& info : kLegacyVersions)
        {
            if (icontains(name, info.label))
            {
                found.insert(info.version);
            }
        }
    }
    return found;
}

ProcessCommand legacy_removal_command(LegacyVersion version, const RemovalContext& context)
{
    return script_command(legacy_version_info(version).removal_script, context);
}

ProcessCommand click_to_run_removal_command(const RemovalContext& context)
{
    return script_command(kClickToRunRemovalScript, context);
}

std::vector<StepPtr> legacy_removal_steps(
    const std::set<LegacyVersion>& versions,
    const RemovalContext& context,
    IProcessRunner& runner,
    DeployLog* log)
{
    std::vector<StepPtr> steps;
    for (LegacyVersion version : versions)
    {
        steps.push_back(std::make_shared<ProcessStep>(
            std::string("Remove ") + legacy_version_info(version).label,
            StepRole::LegacyRemoval,
            legacy_removal_command(version, context),
            runner,
            log));
    }
    return steps;
}

std::map<LegacyVersion, int> remove_legacy(
    const std::set<LegacyVersion>& versions,
    const RemovalContext& context,
    IProcessRunner& runner,
    DeployLog& log)
{
    std::map<LegacyVersion, int> exit_codes;
    if (versions.empty())
    {
        return exit_codes;
    }

    StepRunnerConfig config;
    config.abort_on_failure = false;
    config.abort_on_fault = false;
    SequentialStepRunner step_runner(config, &log);

    std::vector<LegacyVersion> order(versions.begin(), versions.end());
    RunResult result = step_runner.run(legacy_removal_steps(versions, context, runner, &log));

    for (const auto& outcome : result.outcomes)
    {
        LegacyVersion version = order[outcome.step_idx];
        exit_codes[version] = outcome.state == StepState::Faulted
            ? kExitUnexpectedError
            : outcome.exit_code;
    }
    return exit_codes;
}

bool should_remove_click_to_run(bool legacy_removed, const ReconcileResult& reconciled) noexcept
{
    return legacy_removed || reconciled.channel_migration || reconciled.platform_migration;
}

} // namespace odtdeploy
