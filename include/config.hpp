#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>
#include <string_view>

namespace dfa::config
{
    inline constexpr std::string_view version = "1.0.0";

    // closure runs projected to produce more strings than this are refused
    inline constexpr std::size_t default_closure_ceiling = 1'000'000;

    // and so are runs whose strings would hold more characters than this
    inline constexpr std::size_t default_closure_characters = 16'000'000;

    inline constexpr std::size_t default_closure_length = 3;

    inline constexpr std::string_view native_extension    = ".afd";
    inline constexpr std::string_view json_extension      = ".json";
    inline constexpr std::string_view jflap_extension     = ".jff";

    inline constexpr unsigned json_indent = 2;
}

#endif
