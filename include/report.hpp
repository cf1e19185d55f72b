#ifndef REPORT_H
#define REPORT_H

#include "automaton.hpp"
#include "simulator.hpp"
#include "language.hpp"
#include "errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// text renderings of engine results, consumed by the command line front end
namespace report
{
    // one row per state with (I)/(F) markers, one column per alphabet symbol
    [[nodiscard]]
    auto transition_table(const dfa::Automaton& automaton) -> std::string;

    [[nodiscard]]
    auto verdict(std::string_view input, bool accepted) -> std::string;

    // every step up to the cursor, the current one marked with an arrow
    [[nodiscard]]
    auto trace_listing(const dfa::Trace& trace, std::size_t index) -> std::string;

    // the input with the next symbol to read in brackets, e.g. "a[b]a"
    [[nodiscard]]
    auto position_line(const dfa::Trace& trace, std::size_t index) -> std::string;

    [[nodiscard]]
    auto closure_listing(std::string_view title, const language::Closure& closure) -> std::string;

    [[nodiscard]]
    auto decomposition_listing(const language::Decomposition& decomposition) -> std::string;

    [[nodiscard]]
    auto validation_listing(const std::vector<dfa::Error>& errors) -> std::string;
}

#endif
