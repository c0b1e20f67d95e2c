#include "odtdeploy/catalog/update_channel.hpp"
#include "odtdeploy/common/string_util.hpp"

namespace odtdeploy
{

namespace
{

constexpr bool channels_are_indexed_by_enum()
{
    for (size_t i = 0; i < kUpdateChannels.size(); ++i)
    {
        if (static_cast<size_t>(kUpdateChannels[i].channel) != i)
        {
            return false;
        }
    }
    return true;
}

static_assert(channels_are_indexed_by_enum(), "kUpdateChannels must be in UpdateChannel order");

std::string normalize_url(std::string_view url)
{
    std::string value = to_lower_ascii(trim(url));
    while (!value.empty() && value.back() == '/')
    {
        value.pop_back();
    }
    return value;
}

} // namespace

const char* to_string(UpdateChannel channel) noexcept
{
    return update_channel_info(channel).name;
}

std::optional<UpdateChannel> parse_update_channel(std::string_view text)
{
    std::string value = trim(text);
    for (const auto& info : kUpdateChannels)
    {
        if (iequals(value, info.name))
        {
            return info.channel;
        }
    }
    return std::nullopt;
}

std::optional<UpdateChannel> channel_from_cdn_url(std::string_view url)
{
    for (const auto& info : kUpdateChannels)
    {
        if (same_cdn_url(url, info.cdn_base_url))
        {
            return info.channel;
        }
    }
    return std::nullopt;
}

bool same_cdn_url(std::string_view a, std::string_view b)
{
    return normalize_url(a) == normalize_url(b);
}

} // namespace odtdeploy
