// /////////////////////////////////////////////////////////////////////////////
/// @file LineAssembler.hpp
/// @brief Reassembles arbitrarily split text into newline-delimited units.
///
/// Both '\n' and '\r' terminate a unit, so "\r\n" endings work; empty units
/// are never emitted.  A unit longer than the configured limit is discarded
/// up to its terminator and counted as an overflow.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/core/Constants.hpp>
#include <seis/core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace seis::protocol {

class LineAssembler final
{
public:
    explicit LineAssembler(core::usize maxLineLength = core::kMaxLineLength) noexcept;

    /// @brief Appends a chunk and returns every unit it completed.
    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

    /// @brief Returns the pending partial unit (end of stream) and clears it.
    [[nodiscard]] std::optional<std::string> flush();

    /// @brief Drops any buffered partial unit.
    void reset() noexcept;

    [[nodiscard]] bool        hasPartial()    const noexcept { return !buffer_.empty(); }
    [[nodiscard]] core::usize overflowCount() const noexcept { return overflows_; }

private:
    core::usize maxLineLength_;
    std::string buffer_;
    bool        discarding_{false};
    core::usize overflows_{0};
};

} // namespace seis::protocol
