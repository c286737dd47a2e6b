// /////////////////////////////////////////////////////////////////////////////
/// @file Frame.cpp
/// @brief MultiChannelFrame helpers.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/Frame.hpp>

#include <algorithm>

namespace seis::protocol {

core::usize MultiChannelFrame::sampleCount() const noexcept
{
    core::usize count = 0;
    for (const auto& payload : channels)
    {
        count += payload.values.size();
    }
    return count;
}

core::usize MultiChannelFrame::labeledChannelCount() const noexcept
{
    return static_cast<core::usize>(std::count_if(
        channels.begin(), channels.end(),
        [](const ChannelPayload& payload) { return payload.channel != Channel::kUnlabeled; }));
}

} // namespace seis::protocol
