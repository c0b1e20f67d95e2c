#include <gtest/gtest.h>
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/config/deployment_config.hpp"
#include "test_fakes.hpp"

using namespace odtdeploy;
using odtdeploy_test::TempDir;

namespace fs = std::filesystem;

namespace
{

const std::string kBase = "/srv/deploy";

std::string under(const std::string& base, const std::string& relative)
{
    return (fs::path(base) / relative).lexically_normal().string();
}

DeploymentErrorCode error_code_of(const std::string& xml)
{
    try
    {
        parse_deployment_config(xml, kBase);
    }
    catch (const DeploymentError& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "expected DeploymentError for " << xml;
    return DeploymentErrorCode::InvalidArgument;
}

} // namespace

// =============================================================================
// Request parsing
// =============================================================================

TEST(DeploymentRequestTests, ParseType_IsCaseInsensitive)
{
    EXPECT_EQ(parse_deployment_type("Install"), DeploymentType::Install);
    EXPECT_EQ(parse_deployment_type("UNINSTALL"), DeploymentType::Uninstall);
    EXPECT_FALSE(parse_deployment_type("repair").has_value());
}

TEST(DeploymentRequestTests, ParseMode_AcceptsAllModes)
{
    EXPECT_EQ(parse_deploy_mode("interactive"), DeployMode::Interactive);
    EXPECT_EQ(parse_deploy_mode("Silent"), DeployMode::Silent);
    EXPECT_EQ(parse_deploy_mode("NonInteractive"), DeployMode::NonInteractive);
    EXPECT_FALSE(parse_deploy_mode("quiet").has_value());
}

TEST(DeploymentRequestTests, Defaults_InstallInteractive)
{
    DeploymentRequest request;
    EXPECT_EQ(request.type, DeploymentType::Install);
    EXPECT_EQ(request.mode, DeployMode::Interactive);
}

// =============================================================================
// Defaults
// =============================================================================

TEST(DeploymentConfigTests, Default_ResolvesPathsAgainstBase)
{
    DeploymentConfig config = default_deployment_config(kBase);

    EXPECT_EQ(config.support_files_dir, under(kBase, "SupportFiles"));
    EXPECT_EQ(config.log_dir, under(kBase, "Logs"));
    EXPECT_EQ(config.setup_path, under(kBase, "Files/setup.exe"));
    EXPECT_EQ(config.script_host, "cscript.exe");
    EXPECT_EQ(config.platform, Platform::X64);
    EXPECT_EQ(config.channel, UpdateChannel::Deferred);
    EXPECT_EQ(config.success_exit_codes, (std::vector<int>{0, 3010}));
    EXPECT_FALSE(config.configuration_file.empty());
}

// =============================================================================
// XML configuration
// =============================================================================

TEST(DeploymentConfigTests, Parse_ReadsEverySection)
{
    DeploymentConfig config = parse_deployment_config(R"(
        <OdtDeploy_Config>
          <Paths SupportFiles="Support" Logs="/var/log/odt" Setup="Bin/setup.exe"
                 ConfigurationFile="Work/configuration.xml" ScriptHost="wscript.exe"/>
          <Office Platform="x86" Channel="Current" Language="en-us" ForceAppShutdown="false"/>
          <Inventory Snapshot="c2r.reg" InstalledApplications="apps.txt"/>
          <ProductKeys>
            <Key Product="VisioStdXVolume" Value=" 11111-22222-33333-44444-55555 "/>
            <Key Product="ProjectProXVolume" Value="66666-77777-88888-99999-00000"/>
          </ProductKeys>
          <ExitCodes Success="0, 3010, 1641"/>
        </OdtDeploy_Config>)", kBase);

    EXPECT_EQ(config.support_files_dir, under(kBase, "Support"));
    EXPECT_EQ(config.setup_path, under(kBase, "Bin/setup.exe"));
    EXPECT_EQ(config.configuration_file, under(kBase, "Work/configuration.xml"));
    EXPECT_EQ(config.script_host, "wscript.exe");
    EXPECT_EQ(config.platform, Platform::X86);
    EXPECT_EQ(config.channel, UpdateChannel::Current);
    EXPECT_EQ(config.language, "en-us");
    EXPECT_FALSE(config.force_app_shutdown);
    EXPECT_EQ(config.inventory_snapshot, under(kBase, "c2r.reg"));
    EXPECT_EQ(config.installed_applications_list, under(kBase, "apps.txt"));
    EXPECT_EQ(config.product_keys.at(ProductId::VisioStdXVolume), "11111-22222-33333-44444-55555");
    EXPECT_EQ(config.product_keys.at(ProductId::ProjectProXVolume), "66666-77777-88888-99999-00000");
    EXPECT_EQ(config.success_exit_codes, (std::vector<int>{0, 3010, 1641}));
}

#ifndef _WIN32
TEST(DeploymentConfigTests, Parse_AbsolutePathsKept)
{
    DeploymentConfig config = parse_deployment_config(
        R"(<OdtDeploy_Config><Paths Logs="/var/log/odt"/></OdtDeploy_Config>)", kBase);
    EXPECT_EQ(config.log_dir, "/var/log/odt");
}
#endif

TEST(DeploymentConfigTests, Parse_EmptyRootKeepsDefaults)
{
    DeploymentConfig config = parse_deployment_config("<OdtDeploy_Config/>", kBase);
    DeploymentConfig defaults = default_deployment_config(kBase);

    EXPECT_EQ(config.support_files_dir, defaults.support_files_dir);
    EXPECT_EQ(config.setup_path, defaults.setup_path);
    EXPECT_EQ(config.channel, defaults.channel);
    EXPECT_TRUE(config.product_keys.empty());
}

TEST(DeploymentConfigTests, Parse_InvalidValuesRejected)
{
    EXPECT_EQ(error_code_of("<Other/>"), DeploymentErrorCode::ConfigurationInvalid);
    EXPECT_EQ(error_code_of("<OdtDeploy_Config>"), DeploymentErrorCode::ConfigurationInvalid);
    EXPECT_EQ(error_code_of(R"(<OdtDeploy_Config><Office Platform="arm"/></OdtDeploy_Config>)"),
              DeploymentErrorCode::ConfigurationInvalid);
    EXPECT_EQ(error_code_of(R"(<OdtDeploy_Config><Office Channel="Monthly"/></OdtDeploy_Config>)"),
              DeploymentErrorCode::ConfigurationInvalid);
    EXPECT_EQ(error_code_of(R"(<OdtDeploy_Config><Office ForceAppShutdown="maybe"/></OdtDeploy_Config>)"),
              DeploymentErrorCode::ConfigurationInvalid);
    EXPECT_EQ(error_code_of(R"(<OdtDeploy_Config><ExitCodes Success="0,abc"/></OdtDeploy_Config>)"),
              DeploymentErrorCode::ConfigurationInvalid);
    EXPECT_EQ(error_code_of(R"(<OdtDeploy_Config><ExitCodes Success=" , "/></OdtDeploy_Config>)"),
              DeploymentErrorCode::ConfigurationInvalid);
}

TEST(DeploymentConfigTests, Parse_KeyForRetailProductRejected)
{
    EXPECT_EQ(error_code_of(R"(<OdtDeploy_Config><ProductKeys>
                                 <Key Product="VisioProRetail" Value="AAAAA"/>
                               </ProductKeys></OdtDeploy_Config>)"),
              DeploymentErrorCode::ConfigurationInvalid);
    EXPECT_EQ(error_code_of(R"(<OdtDeploy_Config><ProductKeys>
                                 <Key Product="VisioStdXVolume"/>
                               </ProductKeys></OdtDeploy_Config>)"),
              DeploymentErrorCode::ConfigurationInvalid);
}

TEST(DeploymentConfigTests, Load_ResolvesAgainstFileDirectory)
{
    TempDir dir;
    std::string path = dir.write("deploy.xml",
        R"(<OdtDeploy_Config><Paths SupportFiles="Support"/></OdtDeploy_Config>)");

    DeploymentConfig config = load_deployment_config(path);
    EXPECT_EQ(fs::path(config.support_files_dir), fs::path(dir.path()) / "Support");
}

TEST(DeploymentConfigTests, Load_MissingFileThrows)
{
    TempDir dir;
    try
    {
        load_deployment_config(dir.file("absent.xml"));
        FAIL() << "expected DeploymentError";
    }
    catch (const DeploymentError& e)
    {
        EXPECT_EQ(e.code(), DeploymentErrorCode::ConfigurationInvalid);
    }
}
