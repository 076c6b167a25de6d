#pragma once

// Optional header making cidgen types fmt-formattable; it is not included by any other public
// header, so users who do not have fmt available can ignore it.

#include <fmt/format.h>

#include <concepts>
#include <string_view>

namespace cidgen
{
    // Types can opt-in to being fmt-formattable by ensuring they have a ::to_string() method defined
    template <typename T>
    concept ToStringFormattable = requires(T a)
    {
        {
            a.to_string()
            } -> std::convertible_to<std::string_view>;
    };
}  // namespace cidgen

namespace fmt
{
    template <cidgen::ToStringFormattable T>
    struct formatter<T, char> : formatter<std::string_view>
    {
        template <typename FormatContext>
        auto format(const T& val, FormatContext& ctx) const
        {
            return formatter<std::string_view>::format(val.to_string(), ctx);
        }
    };
}  // namespace fmt
