// /////////////////////////////////////////////////////////////////////////////
/// @file LineAssembler.cpp
/// @brief LineAssembler implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/LineAssembler.hpp>

namespace seis::protocol {

LineAssembler::LineAssembler(core::usize maxLineLength) noexcept
    : maxLineLength_{maxLineLength}
{}

std::vector<std::string> LineAssembler::feed(std::string_view chunk)
{
    std::vector<std::string> lines;

    for (const char c : chunk)
    {
        if (c == '\n' || c == '\r')
        {
            if (!discarding_ && !buffer_.empty())
            {
                lines.push_back(std::move(buffer_));
            }
            buffer_.clear();
            discarding_ = false;
            continue;
        }

        if (discarding_)
        {
            continue;
        }

        if (buffer_.size() >= maxLineLength_)
        {
            buffer_.clear();
            discarding_ = true;
            ++overflows_;
            continue;
        }
        buffer_.push_back(c);
    }

    return lines;
}

std::optional<std::string> LineAssembler::flush()
{
    const bool wasDiscarding = discarding_;
    discarding_ = false;
    if (buffer_.empty() || wasDiscarding)
    {
        buffer_.clear();
        return std::nullopt;
    }
    std::string line = std::move(buffer_);
    buffer_.clear();
    return line;
}

void LineAssembler::reset() noexcept
{
    buffer_.clear();
    discarding_ = false;
}

} // namespace seis::protocol
