#include "../include/utility.hpp"

namespace utility
{
    auto indent(std::string_view multi_line_str, unsigned indent_level) -> std::string
    {
        std::string indent(indent_level * 2, ' ');
        return fmt::format(
            "{}{}",
            indent,
            fmt::join(
                multi_line_str
                    | views::split('\n')
                    | views::transform([](auto r) {
                        return std::string_view(r.begin(), r.end());
                    }),
                "\n"+indent
            )
        );
    }
}
