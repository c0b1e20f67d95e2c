#include <gtest/gtest.h>
#include "odtdeploy/catalog/product_catalog.hpp"
#include "odtdeploy/catalog/update_channel.hpp"
#include "odtdeploy/common/deployment_errors.hpp"

using namespace odtdeploy;

// =============================================================================
// Product catalog
// =============================================================================

TEST(ProductCatalogTests, Catalog_HasSevenProducts)
{
    EXPECT_EQ(kProductCatalog.size(), 7u);
}

TEST(ProductCatalogTests, ToString_UsesProductReleaseIds)
{
    EXPECT_STREQ(to_string(ProductId::O365ProPlusRetail), "O365ProPlusRetail");
    EXPECT_STREQ(to_string(ProductId::VisioStdXVolume), "VisioStdXVolume");
    EXPECT_STREQ(to_string(ProductId::ProjectProRetail), "ProjectProRetail");
}

TEST(ProductCatalogTests, Parse_IsCaseInsensitive)
{
    EXPECT_EQ(parse_product_id("visioproretail"), ProductId::VisioProRetail);
    EXPECT_EQ(parse_product_id("  ProjectStdXVolume "), ProductId::ProjectStdXVolume);
}

TEST(ProductCatalogTests, Parse_UnknownReturnsNullopt)
{
    EXPECT_FALSE(parse_product_id("ProPlusVolume").has_value());
    EXPECT_FALSE(parse_product_id("").has_value());
}

TEST(ProductCatalogTests, Require_UnknownThrowsInvalidProduct)
{
    try
    {
        require_product_id("VisioPremium");
        FAIL() << "expected DeploymentError";
    }
    catch (const DeploymentError& e)
    {
        EXPECT_EQ(e.code(), DeploymentErrorCode::InvalidProduct);
        EXPECT_NE(std::string(e.what()).find("VisioPremium"), std::string::npos);
    }
}

TEST(ProductCatalogTests, Families_GroupCompanionEditions)
{
    EXPECT_EQ(product_info(ProductId::O365ProPlusRetail).family, ProductFamily::Suite);
    EXPECT_EQ(product_info(ProductId::VisioStdXVolume).family, ProductFamily::Visio);
    EXPECT_EQ(product_info(ProductId::VisioProRetail).family, ProductFamily::Visio);
    EXPECT_EQ(product_info(ProductId::ProjectProXVolume).family, ProductFamily::Project);
}

TEST(ProductCatalogTests, ProductKey_RequiredForVolumeOnly)
{
    EXPECT_TRUE(product_info(ProductId::VisioStdXVolume).requires_product_key());
    EXPECT_TRUE(product_info(ProductId::ProjectProXVolume).requires_product_key());
    EXPECT_FALSE(product_info(ProductId::VisioProRetail).requires_product_key());
    EXPECT_FALSE(product_info(ProductId::O365ProPlusRetail).requires_product_key());
}

TEST(ProductCatalogTests, ProductIdList_NamesEveryProduct)
{
    std::string list = product_id_list();
    for (const auto& info : kProductCatalog)
    {
        EXPECT_NE(list.find(info.name), std::string::npos) << info.name;
    }
}

// =============================================================================
// Platform
// =============================================================================

TEST(PlatformTests, Parse_AcceptsBothSpellings)
{
    EXPECT_EQ(parse_platform("x64"), Platform::X64);
    EXPECT_EQ(parse_platform("64"), Platform::X64);
    EXPECT_EQ(parse_platform("X86"), Platform::X86);
    EXPECT_EQ(parse_platform("32"), Platform::X86);
    EXPECT_FALSE(parse_platform("arm64").has_value());
}

TEST(PlatformTests, OfficeClientEdition_IsBitness)
{
    EXPECT_STREQ(office_client_edition(Platform::X86), "32");
    EXPECT_STREQ(office_client_edition(Platform::X64), "64");
}

// =============================================================================
// Update channels
// =============================================================================

TEST(UpdateChannelTests, Parse_ByName)
{
    EXPECT_EQ(parse_update_channel("deferred"), UpdateChannel::Deferred);
    EXPECT_EQ(parse_update_channel("FirstReleaseCurrent"), UpdateChannel::FirstReleaseCurrent);
    EXPECT_FALSE(parse_update_channel("Monthly").has_value());
}

TEST(UpdateChannelTests, ChannelFromUrl_IgnoresCaseAndTrailingSlash)
{
    EXPECT_EQ(channel_from_cdn_url(
                  "HTTP://officecdn.microsoft.com/pr/492350F6-3A01-4F97-B9C0-C7C6DDF67D60/"),
              UpdateChannel::Current);
    EXPECT_FALSE(channel_from_cdn_url("http://example.com/pr/other").has_value());
}

TEST(UpdateChannelTests, SameCdnUrl_DistinguishesChannels)
{
    const char* current = update_channel_info(UpdateChannel::Current).cdn_base_url;
    const char* deferred = update_channel_info(UpdateChannel::Deferred).cdn_base_url;
    EXPECT_TRUE(same_cdn_url(current, std::string(current) + "/"));
    EXPECT_FALSE(same_cdn_url(current, deferred));
}
