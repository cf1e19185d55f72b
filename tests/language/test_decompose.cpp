#include <string>
#include <vector>

#include "language.hpp"
#include "check.hpp"

using namespace language;

using Strings = std::vector<std::string>;

int main() {
    auto abc = decompose("abc");
    CHECK((abc.m_substrings == Strings{"a", "b", "c", "ab", "bc", "abc"}));
    CHECK((abc.m_prefixes == Strings{"a", "ab", "abc"}));
    CHECK((abc.m_suffixes == Strings{"abc", "bc", "c"}));

    // repeated spans count once
    auto aaa = decompose("aaa");
    CHECK((aaa.m_substrings == Strings{"a", "aa", "aaa"}));
    CHECK(aaa.m_prefixes.size() == 3);
    CHECK(aaa.m_suffixes.size() == 3);

    auto abab = decompose("abab");
    CHECK((abab.m_substrings == Strings{"a", "b", "ab", "ba", "aba", "bab", "abab"}));

    auto empty = decompose("");
    CHECK(empty.m_substrings.empty());
    CHECK(empty.m_prefixes.empty());
    CHECK(empty.m_suffixes.empty());

    // all distinct characters give n(n+1)/2 substrings
    auto distinct = decompose("abcdef");
    CHECK(distinct.m_substrings.size() == 21);

    return check::finish("test_decompose");
}
