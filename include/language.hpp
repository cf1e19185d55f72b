#ifndef LANGUAGE_H
#define LANGUAGE_H

#include "config.hpp"
#include "errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace language
{
    struct ClosureLimits
    {
        std::size_t m_max_strings{dfa::config::default_closure_ceiling};
        std::size_t m_max_characters{dfa::config::default_closure_characters};
    };

    using Closure = std::vector<std::string>;

    // whitespace is dropped and repeated characters collapse to their first occurrence
    [[nodiscard]]
    auto unique_symbols(std::string_view symbols) -> std::string;

    // number of strings a closure run would produce, saturating at SIZE_MAX
    [[nodiscard]]
    auto projected_size(std::size_t symbol_count, std::size_t max_length, bool include_empty) -> std::size_t;

    // total characters held by those strings, saturating at SIZE_MAX
    [[nodiscard]]
    auto projected_characters(std::size_t symbol_count, std::size_t max_length) -> std::size_t;

    // Enumerates every string over the symbols up to max_length, ordered by
    // length and then by symbol order. Refuses runs above the limit.
    [[nodiscard]]
    auto generate_closure(
        std::string_view symbols,
        std::size_t max_length,
        bool include_empty,
        const ClosureLimits& limits = {}
    ) -> dfa::Result<Closure>;

    [[nodiscard]]
    auto kleene_closure(std::string_view symbols, std::size_t max_length, const ClosureLimits& limits = {})
        -> dfa::Result<Closure>;

    [[nodiscard]]
    auto positive_closure(std::string_view symbols, std::size_t max_length, const ClosureLimits& limits = {})
        -> dfa::Result<Closure>;

    struct Decomposition
    {
        auto operator==(const Decomposition &) const -> bool = default;

        std::vector<std::string> m_substrings;
        std::vector<std::string> m_prefixes;
        std::vector<std::string> m_suffixes;
    };

    // substrings are deduplicated and ordered by length, then by first occurrence
    [[nodiscard]]
    auto decompose(std::string_view input) -> Decomposition;
}

#endif
