// /////////////////////////////////////////////////////////////////////////////
/// @file Sample.cpp
/// @brief Sample metadata accessors.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/Sample.hpp>

namespace seis::protocol {

namespace {

template <typename T>
std::optional<T> lookup(const Metadata& metadata, std::string_view key)
{
    auto it = metadata.find(key);
    if (it == metadata.end())
    {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<T>(&it->second))
    {
        return *value;
    }
    return std::nullopt;
}

} // namespace

std::optional<core::i64> Sample::intMeta(std::string_view key) const
{
    return lookup<core::i64>(metadata, key);
}

std::optional<std::string> Sample::stringMeta(std::string_view key) const
{
    return lookup<std::string>(metadata, key);
}

std::optional<bool> Sample::boolMeta(std::string_view key) const
{
    return lookup<bool>(metadata, key);
}

} // namespace seis::protocol
