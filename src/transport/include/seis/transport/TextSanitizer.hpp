// /////////////////////////////////////////////////////////////////////////////
/// @file TextSanitizer.hpp
/// @brief Tolerant UTF-8 decoding of raw serial bytes.
///
/// Serial lines deliver noise on connect, baud mismatches and partial
/// multi-byte sequences split across reads.  The sanitizer:
///   - carries an incomplete trailing sequence over to the next chunk,
///   - turns every invalid sequence (and U+FFFD itself) into '?',
///   - strips ASCII control characters except TAB, LF and CR.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/core/Types.hpp>

#include <span>
#include <string>
#include <vector>

namespace seis::transport {

class TextSanitizer final
{
public:
    /// @brief Decodes one chunk; bytes of an unfinished sequence are held back.
    [[nodiscard]] std::string decode(std::span<const core::u8> bytes);

    /// @brief Emits '?' for a held-back unfinished sequence (end of stream).
    [[nodiscard]] std::string flush();

    void reset() noexcept { pending_.clear(); }

    [[nodiscard]] bool hasPending() const noexcept { return !pending_.empty(); }

private:
    std::vector<core::u8> pending_;
};

} // namespace seis::transport
