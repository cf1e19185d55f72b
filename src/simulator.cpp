#include "../include/simulator.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace dfa
{
    Trace::Trace(
        std::string_view input,
        std::vector<Configuration>&& configurations,
        const bool accepted
    )
        : m_input{input},
          m_configurations{std::move(configurations)},
          m_accepted{accepted}
    {
    }

    auto Trace::at(std::size_t index) const -> const Configuration&
    {
        return m_configurations.at(index);
    }

    auto Trace::consumed() const -> std::size_t
    {
        return m_configurations.back().m_consumed;
    }

    auto Trace::stuck_symbol() const -> std::optional<char>
    {
        if (fully_consumed())
        {
            return std::nullopt;
        }
        return m_input[consumed()];
    }

    auto Trace::remaining(std::size_t index) const -> std::string_view
    {
        std::string_view input{m_input};
        return input.substr(std::min(at(index).m_consumed, input.size()));
    }

    auto build_trace(const Automaton& automaton, std::string_view input) -> Result<Trace>
    {
        auto initial = automaton.initial_state();
        if (!initial.has_value())
        {
            return make_error(ErrorCode::NoInitialState, "no initial state defined");
        }
        if (automaton.has_epsilon_transitions())
        {
            return make_error(ErrorCode::Validation, "epsilon transitions cannot be simulated by a DFA, remove them first");
        }

        std::vector<Configuration> configurations;
        configurations.reserve(input.size() + 1);
        configurations.emplace_back(0, initial.value(), 0);

        std::string current = initial.value();
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            auto next_state = automaton.target(current, input[i]);
            if (!next_state.has_value())
            {
                spdlog::debug("stuck in '{}' reading '{}' at position {}", current, input[i], i);
                break;
            }
            current = std::move(next_state.value());
            configurations.emplace_back(i + 1, current, i + 1);
        }

        const bool accepted = configurations.back().m_consumed == input.size() && automaton.is_final(current);
        return Trace(input, std::move(configurations), accepted);
    }

    auto accept(const Automaton& automaton, std::string_view input) -> Result<bool>
    {
        return build_trace(automaton, input).map([](const Trace& trace) { return trace.accepted(); });
    }

    auto current_config(const Trace& trace, std::size_t index) -> const Configuration&
    {
        return trace.at(std::min(index, trace.size() - 1));
    }

    auto next(const Trace& trace, std::size_t index) -> std::size_t
    {
        return std::min(index + 1, trace.size() - 1);
    }

    auto prev(const Trace& trace, std::size_t index) -> std::size_t
    {
        if (index == 0)
        {
            return 0;
        }
        return std::min(index - 1, trace.size() - 1);
    }
}
