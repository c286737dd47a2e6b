// /////////////////////////////////////////////////////////////////////////////
/// @file ChannelTokenizer.cpp
/// @brief ChannelTokenizer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/ChannelTokenizer.hpp>
#include <seis/protocol/Numeric.hpp>

#include <string>

namespace seis::protocol {

namespace {

constexpr std::string_view kPrefixTags = "THV";

constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

} // namespace

bool isOrphanMarker(std::string_view field) noexcept
{
    field = trim(field);
    if (field.empty() || (field.front() != 'Y' && field.front() != 'Z'))
    {
        return false;
    }
    return parseAmplitude(field.substr(1)).has_value();
}

namespace {

class FrameBuilder
{
public:
    void open(Channel channel)
    {
        frame_.channels.push_back(ChannelPayload{channel, {}});
    }

    void push(std::string_view token)
    {
        token = trim(token);
        if (token.empty())
        {
            return;
        }
        if (auto value = parseAmplitude(token))
        {
            frame_.channels.back().values.push_back(*value);
        }
        else
        {
            ++frame_.droppedTokens;
        }
    }

    void drop() noexcept { ++frame_.droppedTokens; }

    void setPrefix(const MetadataPrefix& prefix) { frame_.prefix = prefix; }

    [[nodiscard]] MultiChannelFrame take() { return std::move(frame_); }

private:
    MultiChannelFrame frame_;
};

} // namespace

core::Expected<MultiChannelFrame> ChannelTokenizer::tokenize(std::string_view text)
{
    FrameBuilder builder;
    State state = State::kExpectPrefix;

    std::string_view rest = text;
    bool more = true;
    while (more)
    {
        const auto comma = rest.find(',');
        std::string_view field = trim(rest.substr(0, comma));
        if (comma == std::string_view::npos)
        {
            more = false;
        }
        else
        {
            rest.remove_prefix(comma + 1);
        }

        if (field.empty())
        {
            continue;
        }
        const char lead = field.front();

        switch (state)
        {
            case State::kExpectPrefix:
                state = State::kExpectX;
                if (auto prefix = parsePrefix(field))
                {
                    builder.setPrefix(*prefix);
                    break;
                }
                [[fallthrough]];

            case State::kExpectX:
                if (lead == 'X')
                {
                    builder.open(Channel::kX);
                    builder.push(field.substr(1));
                    state = State::kExpectY;
                    break;
                }
                builder.open(Channel::kUnlabeled);
                state = State::kUnlabeled;
                [[fallthrough]];

            case State::kUnlabeled:
                if (isOrphanMarker(field))
                {
                    return core::makeError(core::ErrorCode::kOrphanChannelMarker,
                                           "channel marker '" + std::string(1, lead) +
                                           "' without a preceding X segment");
                }
                builder.push(field);
                break;

            case State::kExpectY:
                if (lead == 'X')
                {
                    builder.push(field.substr(1));
                }
                else if (lead == 'Y')
                {
                    builder.open(Channel::kY);
                    builder.push(field.substr(1));
                    state = State::kExpectZ;
                }
                else if (lead == 'Z')
                {
                    builder.open(Channel::kZ);
                    builder.push(field.substr(1));
                    state = State::kInZ;
                }
                else
                {
                    builder.push(field);
                }
                break;

            case State::kExpectZ:
                if (lead == 'Y')
                {
                    builder.push(field.substr(1));
                }
                else if (lead == 'Z')
                {
                    builder.open(Channel::kZ);
                    builder.push(field.substr(1));
                    state = State::kInZ;
                }
                else if (lead == 'X')
                {
                    builder.drop();
                }
                else
                {
                    builder.push(field);
                }
                break;

            case State::kInZ:
                if (lead == 'Z')
                {
                    builder.push(field.substr(1));
                }
                else if (lead == 'X' || lead == 'Y')
                {
                    builder.drop();
                }
                else
                {
                    builder.push(field);
                }
                break;
        }
    }

    return builder.take();
}

std::optional<MetadataPrefix> ChannelTokenizer::parsePrefix(std::string_view field) noexcept
{
    field = trim(field);
    if (field.empty() || field.front() != 'T')
    {
        return std::nullopt;
    }

    MetadataPrefix prefix;
    core::usize earliestTag = 0;
    core::usize pos = 0;
    while (pos < field.size())
    {
        const auto tag = kPrefixTags.find(field[pos]);
        if (tag == std::string_view::npos || tag < earliestTag)
        {
            return std::nullopt;
        }
        ++pos;

        const auto digitsBegin = pos;
        while (pos < field.size() && isDigit(field[pos]))
        {
            ++pos;
        }
        const auto value = parseDigits(field.substr(digitsBegin, pos - digitsBegin));

        switch (tag)
        {
            case 0: prefix.temperature = value; break;
            case 1: prefix.humidity    = value; break;
            default: prefix.voltage    = value; break;
        }
        earliestTag = tag + 1;
    }
    return prefix;
}

} // namespace seis::protocol
