#include "../include/language.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <ranges>

#include <spdlog/spdlog.h>

namespace language
{
    namespace ranges = std::ranges;

    auto unique_symbols(std::string_view symbols) -> std::string
    {
        std::string unique;
        for (char c : symbols)
        {
            if (std::isspace(static_cast<unsigned char>(c)) || unique.find(c) != std::string::npos)
            {
                continue;
            }
            unique.push_back(c);
        }
        return unique;
    }

    namespace helpers
    {
        constexpr auto saturated = std::numeric_limits<std::size_t>::max();

        static auto saturating_add(std::size_t a, std::size_t b) -> std::size_t
        {
            return a > saturated - b ? saturated : a + b;
        }

        static auto saturating_multiply(std::size_t a, std::size_t b) -> std::size_t
        {
            return a != 0 && b > saturated / a ? saturated : a * b;
        }
    }

    auto projected_size(std::size_t symbol_count, std::size_t max_length, bool include_empty) -> std::size_t
    {
        const std::size_t empty = include_empty ? 1 : 0;
        if (symbol_count == 0)
        {
            return empty;
        }
        if (symbol_count == 1)
        {
            return helpers::saturating_add(max_length, empty);
        }

        // with two or more symbols the level size saturates within 64 rounds
        std::size_t total = empty;
        std::size_t level = 1;
        for (std::size_t length = 1; length <= max_length && total != helpers::saturated; ++length)
        {
            level = helpers::saturating_multiply(level, symbol_count);
            total = helpers::saturating_add(total, level);
        }
        return total;
    }

    auto projected_characters(std::size_t symbol_count, std::size_t max_length) -> std::size_t
    {
        if (symbol_count == 0)
        {
            return 0;
        }
        if (symbol_count == 1)
        {
            if (max_length == helpers::saturated)
            {
                return helpers::saturated;
            }
            // 1 + 2 + ... + max_length
            const auto even = max_length % 2 == 0 ? max_length : max_length + 1;
            const auto odd  = max_length % 2 == 0 ? max_length + 1 : max_length;
            return helpers::saturating_multiply(even / 2, odd);
        }

        std::size_t total = 0;
        std::size_t level = 1;
        for (std::size_t length = 1; length <= max_length && total != helpers::saturated; ++length)
        {
            level = helpers::saturating_multiply(level, symbol_count);
            total = helpers::saturating_add(total, helpers::saturating_multiply(level, length));
        }
        return total;
    }

    auto generate_closure(
        std::string_view symbols,
        std::size_t max_length,
        bool include_empty,
        const ClosureLimits& limits
    ) -> dfa::Result<Closure>
    {
        const std::string alphabet = unique_symbols(symbols);

        const auto expected = projected_size(alphabet.size(), max_length, include_empty);
        if (expected > limits.m_max_strings)
        {
            return dfa::make_error(
                dfa::ErrorCode::ResourceLimit,
                "closure over {} symbols up to length {} would produce more than {} strings",
                alphabet.size(), max_length, limits.m_max_strings
            );
        }
        if (projected_characters(alphabet.size(), max_length) > limits.m_max_characters)
        {
            return dfa::make_error(
                dfa::ErrorCode::ResourceLimit,
                "closure over {} symbols up to length {} would hold more than {} characters",
                alphabet.size(), max_length, limits.m_max_characters
            );
        }

        Closure closure;
        closure.reserve(expected);
        if (include_empty)
        {
            closure.emplace_back();
        }

        // each level extends every string of the previous level by one symbol
        std::vector<std::string> level{""};
        for (std::size_t length = 1; length <= max_length && !alphabet.empty(); ++length)
        {
            std::vector<std::string> extended;
            extended.reserve(level.size() * alphabet.size());
            for (const auto& prefix : level)
            {
                for (char symbol : alphabet)
                {
                    extended.push_back(prefix + symbol);
                }
            }
            ranges::copy(extended, std::back_inserter(closure));
            level = std::move(extended);
        }

        spdlog::debug("generated {} strings over '{}' up to length {}", closure.size(), alphabet, max_length);
        return closure;
    }

    auto kleene_closure(std::string_view symbols, std::size_t max_length, const ClosureLimits& limits)
        -> dfa::Result<Closure>
    {
        return generate_closure(symbols, max_length, true, limits);
    }

    auto positive_closure(std::string_view symbols, std::size_t max_length, const ClosureLimits& limits)
        -> dfa::Result<Closure>
    {
        return generate_closure(symbols, max_length, false, limits);
    }
}
