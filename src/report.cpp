#include "../include/report.hpp"
#include "../include/utility.hpp"

#include <algorithm>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace report
{
    using namespace ::utility;

    static
    auto state_label(const dfa::State& state) -> std::string
    {
        return fmt::format(
            "{}{}{}",
            state.m_id,
            state.m_is_initial ? " (I)" : "",
            state.m_is_final ? " (F)" : ""
        );
    }

    auto transition_table(const dfa::Automaton& automaton) -> std::string
    {
        // symbol columns, epsilon last when the automaton has any
        std::vector<dfa::Symbol> columns;
        for (char c : automaton.alphabet())
        {
            columns.emplace_back(c);
        }
        if (automaton.has_epsilon_transitions())
        {
            columns.push_back(dfa::epsilon);
        }

        // cell text, row by row
        std::vector<std::vector<std::string>> rows;
        std::vector<std::string> header{"State"};
        for (const auto& symbol : columns)
        {
            header.push_back(dfa::symbol_to_string(symbol));
        }
        rows.push_back(header);
        for (const auto& state : automaton.states())
        {
            std::vector<std::string> row{state_label(state)};
            for (const auto& symbol : columns)
            {
                row.push_back(automaton.target(state.m_id, symbol).value_or("-"));
            }
            rows.push_back(std::move(row));
        }

        // "ε" is two bytes but one column wide
        auto width_of = [](std::string_view s) {
            return static_cast<std::size_t>(ranges::count_if(s, [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
        };
        std::vector<std::size_t> widths(header.size(), 0);
        for (const auto& row : rows)
        {
            for (std::size_t i = 0; i < row.size(); ++i)
            {
                widths[i] = std::max(widths[i], width_of(row[i]));
            }
        }

        auto format_row = [&](const std::vector<std::string>& row) {
            std::vector<std::string> cells;
            for (std::size_t i = 0; i < row.size(); ++i)
            {
                cells.push_back(row[i] + std::string(widths[i] - width_of(row[i]), ' '));
            }
            return fmt::format("{}", fmt::join(cells, " | "));
        };

        std::vector<std::string> lines{format_row(rows.front())};
        lines.push_back(fmt::format("{}", fmt::join(
            widths | views::transform([](std::size_t w) { return std::string(w, '-'); }),
            "-+-"
        )));
        for (const auto& row : rows | views::drop(1))
        {
            lines.push_back(format_row(row));
        }
        return join_non_empty_strings(lines, "\n");
    }

    auto verdict(std::string_view input, bool accepted) -> std::string
    {
        return fmt::format("The string \"{}\" is {} by the automaton", input, accepted ? "ACCEPTED" : "REJECTED");
    }

    auto trace_listing(const dfa::Trace& trace, std::size_t index) -> std::string
    {
        const auto cursor = std::min(index, trace.size() - 1);
        std::vector<std::string> lines;
        for (std::size_t i = 0; i <= cursor; ++i)
        {
            const auto& config = trace.at(i);
            lines.push_back(fmt::format(
                "{}Step {}: {}",
                config.m_step == cursor ? "→ " : "  ",
                config.m_step,
                config.m_state
            ));
        }

        if (cursor == trace.size() - 1)
        {
            if (auto symbol = trace.stuck_symbol(); symbol.has_value())
            {
                lines.push_back(fmt::format("  stuck: no transition from {} on '{}'", trace.back().m_state, symbol.value()));
            }
            lines.push_back(fmt::format("  {}", trace.accepted() ? "accepted" : "rejected"));
        }
        return join_non_empty_strings(lines, "\n");
    }

    auto position_line(const dfa::Trace& trace, std::size_t index) -> std::string
    {
        const auto consumed = dfa::current_config(trace, index).m_consumed;
        const auto input = trace.input();
        if (consumed >= input.size())
        {
            return fmt::format("Position: {}", input);
        }
        return fmt::format(
            "Position: {}[{}]{}",
            input.substr(0, consumed),
            input[consumed],
            input.substr(consumed + 1)
        );
    }

    auto closure_listing(std::string_view title, const language::Closure& closure) -> std::string
    {
        return fmt::format(
            "{} - {} strings:\n{}",
            title,
            closure.size(),
            indent(join_quoted(closure, ", "), 1)
        );
    }

    auto decomposition_listing(const language::Decomposition& decomposition) -> std::string
    {
        auto section = [](std::string_view name, const std::vector<std::string>& items) {
            return fmt::format("{} ({}):\n{}", name, items.size(), indent(join_non_empty_strings(items, ", "), 1));
        };
        return fmt::format(
            "{}\n\n{}\n\n{}",
            section("Substrings", decomposition.m_substrings),
            section("Prefixes", decomposition.m_prefixes),
            section("Suffixes", decomposition.m_suffixes)
        );
    }

    auto validation_listing(const std::vector<dfa::Error>& errors) -> std::string
    {
        if (errors.empty())
        {
            return "The automaton is a valid DFA";
        }
        auto lines = errors | views::transform([](const dfa::Error& e) { return fmt::format("- {}", e.m_message); });
        return fmt::format("{} problem(s):\n{}", errors.size(), fmt::join(lines, "\n"));
    }
}
