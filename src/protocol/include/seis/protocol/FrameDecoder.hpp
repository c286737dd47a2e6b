// /////////////////////////////////////////////////////////////////////////////
/// @file FrameDecoder.hpp
/// @brief Stateless decoder of one protocol unit into a Frame.
///
/// Decision order:
///   1. `{` or `[`  -> structured envelope (JSON), if accepted.
///   2. no comma    -> bare number.
///   3. otherwise   -> ChannelTokenizer (optional metadata prefix, X/Y/Z
///                     or unlabeled channel).
/// A unit that yields no valid value decodes to NoData without error.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/protocol/Frame.hpp>
#include <seis/core/Expected.hpp>

#include <string_view>

namespace seis::protocol {

struct DecoderOptions
{
    /// Push transports carry JSON envelopes; serial lines never do.
    bool acceptEnvelopes{true};
};

class FrameDecoder final
{
public:
    explicit FrameDecoder(DecoderOptions options = {}) noexcept;

    /// @brief Decodes one newline- or message-delimited unit.
    /// @return The frame, or kMalformedEnvelope / kOrphanChannelMarker.
    [[nodiscard]] core::Expected<Frame> decode(std::string_view unit) const;

    [[nodiscard]] const DecoderOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] static core::Expected<Frame> decodeEnvelope(std::string_view text);
    [[nodiscard]] static core::Expected<Frame> decodeBare(std::string_view text);

    DecoderOptions options_;
};

} // namespace seis::protocol
