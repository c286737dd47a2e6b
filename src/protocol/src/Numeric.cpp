// /////////////////////////////////////////////////////////////////////////////
/// @file Numeric.cpp
/// @brief Number parsing/formatting on top of std::from_chars/to_chars.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/Numeric.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace seis::protocol {

namespace {

constexpr bool isBlank(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

} // namespace

std::string_view trim(std::string_view text) noexcept
{
    while (!text.empty() && isBlank(text.front()))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && isBlank(text.back()))
    {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<core::f64> parseAmplitude(std::string_view token) noexcept
{
    token = trim(token);
    if (token.size() > 1 && token.front() == '+' && (isDigit(token[1]) || token[1] == '.'))
    {
        token.remove_prefix(1);
    }
    if (token.empty())
    {
        return std::nullopt;
    }

    core::f64 value = 0.0;
    const auto* first = token.data();
    const auto* last  = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || !std::isfinite(value))
    {
        return std::nullopt;
    }
    return value;
}

std::optional<core::i64> parseDigits(std::string_view digits) noexcept
{
    if (digits.empty())
    {
        return std::nullopt;
    }
    core::i64 value = 0;
    const auto* last = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (ec != std::errc{} || ptr != last || value < 0)
    {
        return std::nullopt;
    }
    return value;
}

std::string formatAmplitude(core::f64 value, std::optional<int> fractionDigits)
{
    if (fractionDigits)
    {
        // Sign, every integer digit of the largest double, the point and the fraction.
        std::string fixed(std::numeric_limits<core::f64>::max_exponent10 + 3 +
                              static_cast<core::usize>(std::max(*fractionDigits, 0)),
                          '\0');
        const auto result = std::to_chars(fixed.data(), fixed.data() + fixed.size(),
                                          value, std::chars_format::fixed, *fractionDigits);
        if (result.ec == std::errc{})
        {
            fixed.resize(static_cast<core::usize>(result.ptr - fixed.data()));
            return fixed;
        }
    }

    std::array<char, 64> buffer{};
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (result.ec != std::errc{})
    {
        return {};
    }
    return std::string(buffer.data(), result.ptr);
}

} // namespace seis::protocol
