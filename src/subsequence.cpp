#include "../include/language.hpp"

#include <unordered_set>

namespace language
{
    auto decompose(std::string_view input) -> Decomposition
    {
        Decomposition result;
        const std::size_t n = input.size();

        // shorter spans first, repeated spans are kept once
        std::unordered_set<std::string_view> seen;
        for (std::size_t length = 1; length <= n; ++length)
        {
            for (std::size_t start = 0; start + length <= n; ++start)
            {
                auto span = input.substr(start, length);
                if (seen.insert(span).second)
                {
                    result.m_substrings.emplace_back(span);
                }
            }
        }

        result.m_prefixes.reserve(n);
        result.m_suffixes.reserve(n);
        for (std::size_t k = 1; k <= n; ++k)
        {
            result.m_prefixes.emplace_back(input.substr(0, k));
        }
        for (std::size_t k = 0; k < n; ++k)
        {
            result.m_suffixes.emplace_back(input.substr(k));
        }
        return result;
    }
}
