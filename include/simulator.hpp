#ifndef SIMULATOR_H
#define SIMULATOR_H

#include "automaton.hpp"
#include "errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dfa
{
    struct Configuration
    {
        Configuration() = default;
        Configuration(
            const std::size_t step,
            std::string_view state,
            const std::size_t consumed
        )
            : m_step{step},
              m_state{state},
              m_consumed{consumed} {}

        auto operator<=>(const Configuration &) const = default;

        std::size_t m_step{0};
        std::string m_state;
        std::size_t m_consumed{0};
    };

    class Trace;

    // replays input from the initial state, refusing automata that hold
    // epsilon transitions since they would never be followed
    [[nodiscard]]
    auto build_trace(const Automaton& automaton, std::string_view input) -> Result<Trace>;

    // The ordered configurations visited while replaying one input string.
    // A trace that got stuck ends at the state where no transition existed
    // for the next symbol; it is a complete result, not a failure.
    // Only build_trace creates traces, so the initial configuration is always there.
    class Trace
    {
    public:
        [[nodiscard]]
        auto size() const -> std::size_t { return m_configurations.size(); }

        [[nodiscard]]
        auto at(std::size_t index) const -> const Configuration&;

        [[nodiscard]]
        auto back() const -> const Configuration& { return m_configurations.back(); }

        [[nodiscard]]
        auto configurations() const -> const std::vector<Configuration>& { return m_configurations; }

        [[nodiscard]]
        auto input() const -> std::string_view { return m_input; }

        [[nodiscard]]
        auto consumed() const -> std::size_t;

        [[nodiscard]]
        auto fully_consumed() const -> bool { return consumed() == m_input.size(); }

        [[nodiscard]]
        auto stuck() const -> bool { return !fully_consumed(); }

        // the symbol that had no transition, if the trace got stuck
        [[nodiscard]]
        auto stuck_symbol() const -> std::optional<char>;

        [[nodiscard]]
        auto accepted() const -> bool { return m_accepted; }

        // input left to read at the configuration under index
        [[nodiscard]]
        auto remaining(std::size_t index) const -> std::string_view;

    private:
        friend auto build_trace(const Automaton& automaton, std::string_view input) -> Result<Trace>;

        Trace(
            std::string_view input,
            std::vector<Configuration>&& configurations,
            const bool accepted
        );

        std::string m_input;
        std::vector<Configuration> m_configurations;
        bool m_accepted{false};
    };

    [[nodiscard]]
    auto accept(const Automaton& automaton, std::string_view input) -> Result<bool>;

    // navigation over a trace, the index is owned by the caller
    [[nodiscard]]
    auto current_config(const Trace& trace, std::size_t index) -> const Configuration&;

    [[nodiscard]]
    auto next(const Trace& trace, std::size_t index) -> std::size_t;

    [[nodiscard]]
    auto prev(const Trace& trace, std::size_t index) -> std::size_t;

    [[nodiscard]]
    constexpr auto reset_index() -> std::size_t { return 0; }
}

#endif
