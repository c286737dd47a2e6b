// /////////////////////////////////////////////////////////////////////////////
/// @file ChannelTokenizer.hpp
/// @brief State machine splitting a comma-separated unit into channels.
///
/// Grammar (fields separated by ','):
/// @code
///   unit    := [prefix ','] (labeled | unlabeled)
///   prefix  := 'T' digits* ['H' digits*] ['V' digits*]
///   labeled := 'X' value (',' ['X'] value)*
///              [',' 'Y' value (',' ['Y'] value)*]
///              [',' 'Z' value (',' ['Z'] value)*]
/// @endcode
///
/// States: kExpectPrefix -> kExpectX -> kExpectY -> kExpectZ -> kInZ.
/// kExpectY means "reading X, a Y marker may follow", kExpectZ means
/// "reading Y, a Z marker may follow" (X may jump straight to Z).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/protocol/Frame.hpp>
#include <seis/core/Expected.hpp>
#include <seis/core/Types.hpp>

#include <optional>
#include <string_view>

namespace seis::protocol {

class ChannelTokenizer final
{
public:
    enum class State : core::u8
    {
        kExpectPrefix,
        kExpectX,
        kUnlabeled,
        kExpectY,
        kExpectZ,
        kInZ
    };

    /// @brief Tokenizes one comma-separated unit.
    ///
    /// Non-numeric tokens and out-of-order markers (e.g. an X after Y) are
    /// dropped.  A Y or Z marked value in a unit that does not start with X
    /// is rejected with ErrorCode::kOrphanChannelMarker.
    [[nodiscard]] static core::Expected<MultiChannelFrame> tokenize(std::string_view text);

    /// @brief Parses a `T..H..V..` metadata field.
    /// @return The prefix, or nullopt if @p field is not a metadata field.
    [[nodiscard]] static std::optional<MetadataPrefix> parsePrefix(std::string_view field) noexcept;
};

/// @brief True for a `Y<number>` or `Z<number>` field.
[[nodiscard]] bool isOrphanMarker(std::string_view field) noexcept;

} // namespace seis::protocol
