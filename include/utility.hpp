#ifndef UTILITY_H
#define UTILITY_H

#include <string>
#include <string_view>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    auto join_non_empty_strings(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::filter([](std::string_view s){ return !s.empty(); }), //filter the length zero elements
                delim
            )
        );
    }

    // quotes each element so that the empty string stays visible
    auto join_quoted(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::transform([](std::string_view s){ return fmt::format("\"{}\"", s); }),
                delim
            )
        );
    }

    auto indent(std::string_view multi_line_str, unsigned indent_level) -> std::string;
}

#endif
