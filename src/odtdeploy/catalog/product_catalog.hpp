/**
 * @file product_catalog.hpp
 * @brief Closed catalog of deployable Office product editions.
 */
#pragma once
#include "odtdeploy/common/common.hpp"

namespace odtdeploy
{

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Product editions that can be deployed.
 *
 * @details
 * The catalog is closed: product release ids outside this list are never
 * represented by a ProductId. Enumerator names match the ODT product ids.
 */
enum class ProductId
{
    O365ProPlusRetail,
    VisioStdXVolume,
    VisioProXVolume,
    VisioProRetail,
    ProjectStdXVolume,
    ProjectProXVolume,
    ProjectProRetail
};

/**
 * @brief Product family.
 *
 * @details
 * Substitution rules only ever relate two products of the same companion
 * family (Visio or Project). The full suite is a family of its own.
 */
enum class ProductFamily
{
    Suite,
    Visio,
    Project
};

/**
 * @brief Licensing model of a product edition.
 *
 * @par Key requirement
 * - `Volume` editions are activated with a product key written to the
 *   configuration document.
 * - `RetailSubscription` editions are activated by the user's subscription
 *   and carry no key.
 */
enum class LicenseTier
{
    Volume,
    RetailSubscription
};

/**
 * @brief Feature tier of a product edition.
 */
enum class EditionTier
{
    Standard,
    Professional
};

/**
 * @brief Static description of one catalog entry.
 */
struct ProductInfo
{
    ProductId id;
    const char* name;
    const char* display_name;
    ProductFamily family;
    LicenseTier license;
    EditionTier tier;

    constexpr bool requires_product_key() const noexcept
    {
        return license == LicenseTier::Volume;
    }
};

constexpr size_t kProductCount = 7;

/**
 * @brief The catalog, in ProductId order.
 */
constexpr std::array<ProductInfo, kProductCount> kProductCatalog{{
    {ProductId::O365ProPlusRetail, "O365ProPlusRetail", "Office 365 ProPlus",
     ProductFamily::Suite, LicenseTier::RetailSubscription, EditionTier::Professional},
    {ProductId::VisioStdXVolume, "VisioStdXVolume", "Visio Standard (volume)",
     ProductFamily::Visio, LicenseTier::Volume, EditionTier::Standard},
    {ProductId::VisioProXVolume, "VisioProXVolume", "Visio Professional (volume)",
     ProductFamily::Visio, LicenseTier::Volume, EditionTier::Professional},
    {ProductId::VisioProRetail, "VisioProRetail", "Visio Pro for Office 365",
     ProductFamily::Visio, LicenseTier::RetailSubscription, EditionTier::Professional},
    {ProductId::ProjectStdXVolume, "ProjectStdXVolume", "Project Standard (volume)",
     ProductFamily::Project, LicenseTier::Volume, EditionTier::Standard},
    {ProductId::ProjectProXVolume, "ProjectProXVolume", "Project Professional (volume)",
     ProductFamily::Project, LicenseTier::Volume, EditionTier::Professional},
    {ProductId::ProjectProRetail, "ProjectProRetail", "Project Online Desktop Client",
     ProductFamily::Project, LicenseTier::RetailSubscription, EditionTier::Professional},
}};

/**
 * @brief Look up the catalog entry of a product.
 */
constexpr const ProductInfo& product_info(ProductId id) noexcept
{
    return kProductCatalog[static_cast<size_t>(id)];
}

/**
 * @brief Get the ODT product id string (e.g. "VisioProRetail").
 */
const char* to_string(ProductId id) noexcept;

/**
 * @brief Parse an ODT product id string.
 * @param text Product id; matched case-insensitively, surrounding whitespace ignored.
 * @return The product, or std::nullopt if it is not in the catalog.
 */
std::optional<ProductId> parse_product_id(std::string_view text);

/**
 * @brief Parse an ODT product id string, rejecting values outside the catalog.
 * @throws DeploymentError with code InvalidProduct.
 */
ProductId require_product_id(std::string_view text);

/**
 * @brief Comma-separated list of all catalog product ids, for usage output.
 */
std::string product_id_list();

// ============================================================================
// Platform
// ============================================================================

/**
 * @brief Target processor architecture of the Office installation.
 */
enum class Platform
{
    X86,
    X64
};

/**
 * @brief Get the registry spelling ("x86" / "x64").
 */
const char* to_string(Platform platform) noexcept;

/**
 * @brief Get the ODT OfficeClientEdition value ("32" / "64").
 */
const char* office_client_edition(Platform platform) noexcept;

/**
 * @brief Parse a platform tag.
 * @details Accepts "x86", "x64", "32", "64" (case-insensitive).
 */
std::optional<Platform> parse_platform(std::string_view text);

} // namespace odtdeploy
