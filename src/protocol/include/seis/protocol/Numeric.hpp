// /////////////////////////////////////////////////////////////////////////////
/// @file Numeric.hpp
/// @brief Locale-independent number parsing and formatting for the wire
///        grammar.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace seis::protocol {

/// @brief Strips ASCII blanks (space, tab, CR, LF) from both ends.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

/// @brief Parses a whole token as a finite decimal number.
///
/// Surrounding blanks and a single leading '+' are accepted.  Trailing
/// garbage, NaN and infinities are rejected.
[[nodiscard]] std::optional<core::f64> parseAmplitude(std::string_view token) noexcept;

/// @brief Parses an unsigned run of decimal digits.
[[nodiscard]] std::optional<core::i64> parseDigits(std::string_view digits) noexcept;

/// @brief Formats a value for the wire.
/// @param value          Finite value.
/// @param fractionDigits Fixed precision, or shortest round-trip form when
///                       empty.
[[nodiscard]] std::string formatAmplitude(core::f64 value,
                                          std::optional<int> fractionDigits = std::nullopt);

} // namespace seis::protocol
