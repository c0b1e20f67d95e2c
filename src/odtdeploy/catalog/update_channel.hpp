/**
 * @file update_channel.hpp
 * @brief Click-to-Run update channels and their CDN base URLs.
 */
#pragma once
#include "odtdeploy/common/common.hpp"

namespace odtdeploy
{

/**
 * @brief Click-to-Run update channel.
 *
 * @details
 * An installation records its channel as the CDN base URL it updates from
 * (`CDNBaseUrl`). The ODT configuration names the channel instead.
 */
enum class UpdateChannel
{
    Current,
    Deferred,
    FirstReleaseCurrent,
    FirstReleaseDeferred
};

struct UpdateChannelInfo
{
    UpdateChannel channel;
    const char* name;
    const char* cdn_base_url;
};

constexpr std::array<UpdateChannelInfo, 4> kUpdateChannels{{
    {UpdateChannel::Current, "Current",
     "http://officecdn.microsoft.com/pr/492350f6-3a01-4f97-b9c0-c7c6ddf67d60"},
    {UpdateChannel::Deferred, "Deferred",
     "http://officecdn.microsoft.com/pr/7ffbc6bf-bc32-4f92-8982-f9dd17fd3114"},
    {UpdateChannel::FirstReleaseCurrent, "FirstReleaseCurrent",
     "http://officecdn.microsoft.com/pr/64256afe-f5d9-4f86-8936-8840a6a4f5be"},
    {UpdateChannel::FirstReleaseDeferred, "FirstReleaseDeferred",
     "http://officecdn.microsoft.com/pr/b8f9b850-328d-4355-9145-c59439a0c4cf"},
}};

constexpr const UpdateChannelInfo& update_channel_info(UpdateChannel channel) noexcept
{
    return kUpdateChannels[static_cast<size_t>(channel)];
}

/**
 * @brief Get the ODT channel name.
 */
const char* to_string(UpdateChannel channel) noexcept;

/**
 * @brief Parse an ODT channel name (case-insensitive).
 */
std::optional<UpdateChannel> parse_update_channel(std::string_view text);

/**
 * @brief Identify the channel an installation's CDN base URL belongs to.
 * @return std::nullopt for URLs outside the known channel list.
 */
std::optional<UpdateChannel> channel_from_cdn_url(std::string_view url);

/**
 * @brief Compare two CDN base URLs.
 * @details Case-insensitive; a trailing '/' is ignored.
 */
bool same_cdn_url(std::string_view a, std::string_view b);

} // namespace odtdeploy
