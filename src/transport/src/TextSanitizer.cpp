// /////////////////////////////////////////////////////////////////////////////
/// @file TextSanitizer.cpp
/// @brief TextSanitizer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/transport/TextSanitizer.hpp>

#include <cstddef>

namespace seis::transport {

namespace {

constexpr char kReplacement = '?';

constexpr bool isStrippedControl(core::u8 b) noexcept
{
    return (b <= 0x08) || b == 0x0B || b == 0x0C || (b >= 0x0E && b <= 0x1F) || b == 0x7F;
}

/// Total length of the sequence introduced by @p lead, 0 if not a lead byte.
constexpr core::usize sequenceLength(core::u8 lead) noexcept
{
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

/// Validates byte @p index (1-based position after the lead) of a sequence.
constexpr bool isValidContinuation(core::u8 lead, core::usize index, core::u8 b) noexcept
{
    if (index == 1)
    {
        switch (lead)
        {
            case 0xE0: return b >= 0xA0 && b <= 0xBF;
            case 0xED: return b >= 0x80 && b <= 0x9F;
            case 0xF0: return b >= 0x90 && b <= 0xBF;
            case 0xF4: return b >= 0x80 && b <= 0x8F;
            default:   break;
        }
    }
    return b >= 0x80 && b <= 0xBF;
}

} // namespace

std::string TextSanitizer::decode(std::span<const core::u8> bytes)
{
    std::vector<core::u8> input;
    input.reserve(pending_.size() + bytes.size());
    input.insert(input.end(), pending_.begin(), pending_.end());
    input.insert(input.end(), bytes.begin(), bytes.end());
    pending_.clear();

    std::string out;
    out.reserve(input.size());

    core::usize i = 0;
    while (i < input.size())
    {
        const core::u8 lead = input[i];
        if (lead < 0x80)
        {
            if (!isStrippedControl(lead))
            {
                out.push_back(static_cast<char>(lead));
            }
            ++i;
            continue;
        }

        const core::usize length = sequenceLength(lead);
        if (length == 0)
        {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        core::usize matched = 1;
        while (matched < length && i + matched < input.size() &&
               isValidContinuation(lead, matched, input[i + matched]))
        {
            ++matched;
        }

        if (matched < length && i + matched == input.size())
        {
            // Valid so far but cut by the chunk boundary.
            pending_.assign(input.begin() + static_cast<std::ptrdiff_t>(i), input.end());
            break;
        }

        if (matched < length)
        {
            out.push_back(kReplacement);
            i += matched;
            continue;
        }

        const bool isReplacementChar =
            length == 3 && lead == 0xEF && input[i + 1] == 0xBF && input[i + 2] == 0xBD;
        if (isReplacementChar)
        {
            out.push_back(kReplacement);
        }
        else
        {
            out.append(reinterpret_cast<const char*>(&input[i]), length);
        }
        i += length;
    }

    return out;
}

std::string TextSanitizer::flush()
{
    if (pending_.empty())
    {
        return {};
    }
    pending_.clear();
    return std::string(1, kReplacement);
}

} // namespace seis::transport
