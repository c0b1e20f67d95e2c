#include <gtest/gtest.h>
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/inventory/installed_applications.hpp"
#include "odtdeploy/inventory/inventory_source.hpp"
#include "test_fakes.hpp"

using namespace odtdeploy;
using odtdeploy_test::TempDir;

namespace
{

// `reg export` output: UTF-16LE with a byte order mark and CRLF line ends.
std::string utf16le_with_bom(const std::string& ascii)
{
    std::string bytes("\xFF\xFE", 2);
    for (char c : ascii)
    {
        if (c == '\n')
        {
            bytes.append("\r\0", 2);
        }
        bytes.push_back(c);
        bytes.push_back('\0');
    }
    return bytes;
}

} // namespace

class InventorySourceTests : public ::testing::Test
{
protected:
    DeployLog log{nullptr};
    TempDir dir;
};

// =============================================================================
// parse_inventory
// =============================================================================

TEST_F(InventorySourceTests, Parse_ReadsAllValues)
{
    ClickToRunValues values;
    values.platform = "x86";
    values.cdn_base_url = "http://officecdn.microsoft.com/pr/7ffbc6bf-bc32-4f92-8982-f9dd17fd3114";
    values.product_release_ids = "O365ProPlusRetail,VisioStdXVolume";

    InstalledInventory inventory = parse_inventory(values, log);

    ASSERT_EQ(inventory.products.size(), 2u);
    EXPECT_EQ(inventory.products[0], ProductId::O365ProPlusRetail);
    EXPECT_EQ(inventory.products[1], ProductId::VisioStdXVolume);
    EXPECT_EQ(inventory.platform, Platform::X86);
    EXPECT_EQ(inventory.channel_url, values.cdn_base_url);
}

TEST_F(InventorySourceTests, Parse_UnknownIdsAreSkippedWithWarning)
{
    ClickToRunValues values;
    values.product_release_ids = "ProPlusRetail,VisioProRetail,LanguagePack";

    InstalledInventory inventory = parse_inventory(values, log);

    ASSERT_EQ(inventory.products.size(), 1u);
    EXPECT_EQ(inventory.products[0], ProductId::VisioProRetail);
    EXPECT_EQ(log.count(Severity::Warning), 2u);
}

TEST_F(InventorySourceTests, Parse_DuplicateIdsCollapse)
{
    ClickToRunValues values;
    values.product_release_ids = "VisioProRetail,visioproretail";

    InstalledInventory inventory = parse_inventory(values, log);
    EXPECT_EQ(inventory.products.size(), 1u);
}

TEST_F(InventorySourceTests, Parse_UnrecognizedPlatformLeftUnset)
{
    ClickToRunValues values;
    values.platform = "arm64";
    values.product_release_ids = "VisioProRetail";

    InstalledInventory inventory = parse_inventory(values, log);
    EXPECT_FALSE(inventory.platform.has_value());
    EXPECT_EQ(log.count(Severity::Warning), 1u);
}

TEST_F(InventorySourceTests, Parse_PlatformWithoutCatalogProductWarns)
{
    ClickToRunValues values;
    values.platform = "x86";
    values.cdn_base_url = "http://officecdn.microsoft.com/pr/492350f6-3a01-4f97-b9c0-c7c6ddf67d60";
    values.product_release_ids = "ProPlusRetail";

    InstalledInventory inventory = parse_inventory(values, log);

    EXPECT_TRUE(inventory.empty());
    EXPECT_EQ(inventory.platform, Platform::X86);
    // One for the unknown release id, one for the ignored platform and channel.
    EXPECT_EQ(log.count(Severity::Warning), 2u);
}

TEST_F(InventorySourceTests, Parse_EmptyValuesGiveEmptyInventory)
{
    InstalledInventory inventory = parse_inventory(ClickToRunValues{}, log);
    EXPECT_TRUE(inventory.empty());
    EXPECT_FALSE(inventory.platform.has_value());
    EXPECT_TRUE(inventory.channel_url.empty());
    EXPECT_EQ(log.count(Severity::Warning), 0u);
}

// =============================================================================
// SnapshotInventorySource
// =============================================================================

TEST_F(InventorySourceTests, Snapshot_MissingFileIsEmptyInventory)
{
    SnapshotInventorySource source(dir.file("absent.reg"), log);
    InstalledInventory inventory = source.read_inventory();
    EXPECT_TRUE(inventory.empty());
}

TEST_F(InventorySourceTests, Snapshot_ReadsRegExportFormat)
{
    std::string path = dir.write("c2r.reg",
        "Windows Registry Editor Version 5.00\n"
        "\n"
        "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Office\\ClickToRun\\Configuration]\n"
        "\"Platform\"=\"x64\"\n"
        "\"CDNBaseUrl\"=\"http://officecdn.microsoft.com/pr/492350f6-3a01-4f97-b9c0-c7c6ddf67d60\"\n"
        "\"ProductReleaseIds\"=\"VisioProRetail,ProjectProXVolume\"\n");

    SnapshotInventorySource source(path, log);
    InstalledInventory inventory = source.read_inventory();

    ASSERT_EQ(inventory.products.size(), 2u);
    EXPECT_TRUE(inventory.contains(ProductId::VisioProRetail));
    EXPECT_TRUE(inventory.contains(ProductId::ProjectProXVolume));
    EXPECT_EQ(inventory.platform, Platform::X64);
    EXPECT_EQ(inventory.channel_url,
              "http://officecdn.microsoft.com/pr/492350f6-3a01-4f97-b9c0-c7c6ddf67d60");
}

TEST_F(InventorySourceTests, Snapshot_ReadsUtf16RegExport)
{
    std::string path = dir.write("c2r_utf16.reg", utf16le_with_bom(
        "Windows Registry Editor Version 5.00\n"
        "\n"
        "[HKEY_LOCAL_MACHINE\\SOFTWARE\\Microsoft\\Office\\ClickToRun\\Configuration]\n"
        "\"Platform\"=\"x86\"\n"
        "\"ProductReleaseIds\"=\"O365ProPlusRetail,VisioStdXVolume\"\n"));

    SnapshotInventorySource source(path, log);
    InstalledInventory inventory = source.read_inventory();

    ASSERT_EQ(inventory.products.size(), 2u);
    EXPECT_EQ(inventory.products[0], ProductId::O365ProPlusRetail);
    EXPECT_EQ(inventory.products[1], ProductId::VisioStdXVolume);
    EXPECT_EQ(inventory.platform, Platform::X86);
    EXPECT_EQ(log.count(Severity::Warning), 0u);
}

TEST_F(InventorySourceTests, Snapshot_Utf8BomIsSkipped)
{
    std::string path = dir.write("c2r_utf8.txt", "\xEF\xBB\xBFPlatform=x64\nProductReleaseIds=VisioProRetail\n");

    SnapshotInventorySource source(path, log);
    InstalledInventory inventory = source.read_inventory();

    EXPECT_EQ(inventory.platform, Platform::X64);
    EXPECT_TRUE(inventory.contains(ProductId::VisioProRetail));
}

TEST_F(InventorySourceTests, Snapshot_Utf16BigEndianRejected)
{
    std::string path = dir.write("c2r_be.reg", std::string("\xFE\xFF\0P", 4));

    SnapshotInventorySource source(path, log);
    try
    {
        source.read_inventory();
        FAIL() << "expected DeploymentError";
    }
    catch (const DeploymentError& e)
    {
        EXPECT_EQ(e.code(), DeploymentErrorCode::InventoryUnavailable);
        EXPECT_NE(std::string(e.what()).find("UTF-16BE"), std::string::npos);
    }
}

TEST_F(InventorySourceTests, Snapshot_ReadsPlainFormatAndSkipsComments)
{
    std::string path = dir.write("c2r.txt",
        "# captured from a test machine\n"
        "; another comment\n"
        "Platform = x86\n"
        "ProductReleaseIds = O365ProPlusRetail\n"
        "Unrelated = value\n");

    SnapshotInventorySource source(path, log);
    InstalledInventory inventory = source.read_inventory();

    ASSERT_EQ(inventory.products.size(), 1u);
    EXPECT_EQ(inventory.products[0], ProductId::O365ProPlusRetail);
    EXPECT_EQ(inventory.platform, Platform::X86);
    EXPECT_TRUE(inventory.channel_url.empty());
}

// =============================================================================
// ListFileInstalledApplications
// =============================================================================

TEST_F(InventorySourceTests, InstalledApplications_ReadsOneNamePerLine)
{
    std::string path = dir.write("apps.txt",
        "# DisplayName values\n"
        "Microsoft Office Professional Plus 2010\n"
        "\n"
        "  7-Zip 19.00  \n");

    ListFileInstalledApplications apps(path, log);
    auto names = apps.display_names();

    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "Microsoft Office Professional Plus 2010");
    EXPECT_EQ(names[1], "7-Zip 19.00");
}

TEST_F(InventorySourceTests, InstalledApplications_MissingFileIsEmpty)
{
    ListFileInstalledApplications apps(dir.file("absent.txt"), log);
    EXPECT_TRUE(apps.display_names().empty());
}
