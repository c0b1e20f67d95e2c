#include "odtdeploy/catalog/product_catalog.hpp"
#include "odtdeploy/common/deployment_errors.hpp"
#include "odtdeploy/common/string_util.hpp"

namespace odtdeploy
{

namespace
{

constexpr bool catalog_is_indexed_by_id()
{
    for (size_t i = 0; i < kProductCatalog.size(); ++i)
    {
        if (static_cast<size_t>(kProductCatalog[i].id) != i)
        {
            return false;
        }
    }
    return true;
}

static_assert(catalog_is_indexed_by_id(), "kProductCatalog must be in ProductId order");

} // namespace

const char* to_string(ProductId id) noexcept
{
    return product_info(id).name;
}

std::optional<ProductId> parse_product_id(std::string_view text)
{
    std::string value = trim(text);
    for (const auto& info : kProductCatalog)
    {
        if (iequals(value, info.name))
        {
            return info.id;
        }
    }
    return std::nullopt;
}

ProductId require_product_id(std::string_view text)
{
    auto id = parse_product_id(text);
    if (!id)
    {
        throw DeploymentError(DeploymentErrorCode::InvalidProduct,
            "Unknown product '" + std::string(text) + "'. Expected one of: " +
            product_id_list());
    }
    return *id;
}

std::string product_id_list()
{
    std::string result;
    for (const auto& info : kProductCatalog)
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += info.name;
    }
    return result;
}

const char* to_string(Platform platform) noexcept
{
    return platform == Platform::X64 ? "x64" : "x86";
}

const char* office_client_edition(Platform platform) noexcept
{
    return platform == Platform::X64 ? "64" : "32";
}

std::optional<Platform> parse_platform(std::string_view text)
{
    std::string value = to_lower_ascii(trim(text));
    if (value == "x64" || value == "64")
    {
        return Platform::X64;
    }
    if (value == "x86" || value == "32")
    {
        return Platform::X86;
    }
    return std::nullopt;
}

} // namespace odtdeploy
