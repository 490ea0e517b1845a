#pragma once

#include <tempo/callbacks.hpp>
#include <tempo/config.hpp>
#include <tempo/error.hpp>

#include <fmt/core.h>
#include <string>
#include <type_traits>

namespace tempo::detail
{

template<typename Operation, typename T>
void validate_call(const Operation& operation, const callback_set<T>& callbacks)
{
    if (!operation)
        throw configuration_error("operation cannot be null");

    if (!callbacks.on_success)
        throw configuration_error("on_success cannot be null");
}

inline void validate_duration(duration value, const char* name)
{
    if (value < duration::zero())
        throw configuration_error(fmt::format("{} must not be negative", name));
}

/// Printable form of a call key for observers and logs.
template<typename Key>
std::string key_label(const Key& key)
{
    if constexpr (std::is_convertible_v<const Key&, std::string>)
        return std::string(key);
    else if constexpr (fmt::is_formattable<Key>::value)
        return fmt::format("{}", key);
    else
        return "<key>";
}

} // namespace tempo::detail
