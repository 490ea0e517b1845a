#pragma once

#include <tempo/outcome.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tempo::detail
{

template<typename T>
struct is_optional : std::false_type
{
};

template<typename U>
struct is_optional<std::optional<U>> : std::true_type
{
};

template<typename T>
struct is_smart_pointer : std::false_type
{
};

template<typename U>
struct is_smart_pointer<std::shared_ptr<U>> : std::true_type
{
};

template<typename U, typename D>
struct is_smart_pointer<std::unique_ptr<U, D>> : std::true_type
{
};

// Text is a value, not a collection: "" classifies as success
template<typename T>
struct is_text : std::false_type
{
};

template<typename C, typename Tr, typename A>
struct is_text<std::basic_string<C, Tr, A>> : std::true_type
{
};

template<typename C, typename Tr>
struct is_text<std::basic_string_view<C, Tr>> : std::true_type
{
};

template<typename T, typename = void>
struct has_empty : std::false_type
{
};

template<typename T>
struct has_empty<T, std::void_t<decltype(std::declval<const T&>().empty())>> : std::true_type
{
};

template<typename T>
inline constexpr bool is_collection_v = has_empty<T>::value && !is_text<T>::value;

/// Map a produced value to null / empty / success.
template<typename T>
outcome_kind classify(const T& value)
{
    if constexpr (std::is_null_pointer_v<T>)
    {
        (void) value;
        return outcome_kind::null;
    }
    else if constexpr (is_optional<T>::value)
    {
        if (!value.has_value())
            return outcome_kind::null;
        return classify(*value);
    }
    else if constexpr (std::is_pointer_v<T> || is_smart_pointer<T>::value)
    {
        return value == nullptr ? outcome_kind::null : outcome_kind::success;
    }
    else if constexpr (is_collection_v<T>)
    {
        return value.empty() ? outcome_kind::empty : outcome_kind::success;
    }
    else
    {
        return outcome_kind::success;
    }
}

} // namespace tempo::detail
