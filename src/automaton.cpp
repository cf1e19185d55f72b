#include "../include/automaton.hpp"

#include <algorithm>
#include <ranges>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dfa
{
    // namespaces aliases
    namespace views  = std::views;
    namespace ranges = std::ranges;

    auto symbol_to_string(const Symbol& symbol) -> std::string
    {
        if (symbol.has_value())
        {
            return std::string(1, symbol.value());
        }
        return "ε";
    }

    auto Automaton::operator==(const Automaton& other) const -> bool
    {
        return m_states == other.m_states
            && m_alphabet == other.m_alphabet
            && m_transitions == other.m_transitions;
    }

    auto Automaton::state_position(std::string_view id) -> std::vector<State>::iterator
    {
        return ranges::find(m_states, id, &State::m_id);
    }

    auto Automaton::state_position(std::string_view id) const -> std::vector<State>::const_iterator
    {
        return ranges::find(m_states, id, &State::m_id);
    }

    auto Automaton::require_states(std::string_view from, std::string_view to) const -> Result<void>
    {
        if (!has_state(from))
        {
            return make_error(ErrorCode::UnknownState, "state '{}' does not exist", from);
        }
        if (!has_state(to))
        {
            return make_error(ErrorCode::UnknownState, "state '{}' does not exist", to);
        }
        return {};
    }

    auto Automaton::add_state(std::string_view id, bool is_initial, bool is_final) -> Result<void>
    {
        if (has_state(id))
        {
            return make_error(ErrorCode::DuplicateState, "state '{}' already exists", id);
        }

        // only one state may ever hold the initial marking
        if (is_initial)
        {
            for (auto& state : m_states)
            {
                state.m_is_initial = false;
            }
        }

        m_states.emplace_back(id, is_initial, is_final);
        touch();
        spdlog::debug("added state '{}' (initial: {}, final: {})", id, is_initial, is_final);
        return {};
    }

    auto Automaton::remove_state(std::string_view id) -> Result<void>
    {
        auto it = state_position(id);
        if (it == m_states.end())
        {
            return make_error(ErrorCode::UnknownState, "state '{}' does not exist", id);
        }

        // cascade to every transition leaving or entering the state
        std::erase_if(m_transitions, [id](const auto& entry) {
            const auto& [key, to] = entry;
            return key.m_state == id || to == id;
        });

        m_states.erase(it);
        touch();
        spdlog::debug("removed state '{}'", id);
        return {};
    }

    auto Automaton::set_initial(std::string_view id) -> Result<void>
    {
        if (!has_state(id))
        {
            return make_error(ErrorCode::UnknownState, "state '{}' does not exist", id);
        }

        for (auto& state : m_states)
        {
            state.m_is_initial = state.m_id == id;
        }
        touch();
        return {};
    }

    auto Automaton::set_final(std::string_view id, bool flag) -> Result<void>
    {
        auto it = state_position(id);
        if (it == m_states.end())
        {
            return make_error(ErrorCode::UnknownState, "state '{}' does not exist", id);
        }

        it->m_is_final = flag;
        touch();
        return {};
    }

    auto Automaton::add_symbol(char symbol) -> void
    {
        if (m_alphabet.insert(symbol).second)
        {
            touch();
        }
    }

    auto Automaton::add_transition(std::string_view from, const Symbol& symbol, std::string_view to) -> Result<void>
    {
        if (!symbol.has_value())
        {
            return make_error(
                ErrorCode::Validation,
                "epsilon transition {} -> {} is not allowed in a deterministic automaton", from, to
            );
        }
        return import_transition(from, symbol, to);
    }

    auto Automaton::import_transition(std::string_view from, const Symbol& symbol, std::string_view to) -> Result<void>
    {
        if (auto known = require_states(from, to); !known)
        {
            return known;
        }

        TransitionKey key(from, symbol);
        if (auto existing = m_transitions.find(key); existing != m_transitions.end())
        {
            if (existing->second == to)
            {
                return {};
            }
            return make_error(
                ErrorCode::NonDeterministicTransition,
                "state '{}' already moves to '{}' on '{}', cannot also move to '{}'",
                from, existing->second, symbol_to_string(symbol), to
            );
        }

        if (symbol.has_value())
        {
            m_alphabet.insert(symbol.value());
        }
        m_transitions.emplace(std::move(key), std::string(to));
        touch();
        spdlog::debug("added transition {},{} -> {}", from, symbol_to_string(symbol), to);
        return {};
    }

    auto Automaton::replace_transition(std::string_view from, const Symbol& symbol, std::string_view to) -> Result<void>
    {
        if (auto known = require_states(from, to); !known)
        {
            return known;
        }

        if (symbol.has_value())
        {
            m_alphabet.insert(symbol.value());
        }
        m_transitions.insert_or_assign(TransitionKey(from, symbol), std::string(to));
        touch();
        return {};
    }

    auto Automaton::remove_transition(std::string_view from, const Symbol& symbol) -> Result<void>
    {
        if (!has_state(from))
        {
            return make_error(ErrorCode::UnknownState, "state '{}' does not exist", from);
        }

        if (m_transitions.erase(TransitionKey(from, symbol)) > 0)
        {
            touch();
        }
        return {};
    }

    auto Automaton::reset() -> void
    {
        m_states.clear();
        m_alphabet.clear();
        m_transitions.clear();
        touch();
    }

    auto Automaton::validate() const -> std::vector<Error>
    {
        std::vector<Error> errors;
        auto report = [&errors]<typename... Args>(fmt::format_string<Args...> format, Args&&... args) {
            errors.emplace_back(ErrorCode::Validation, fmt::format(format, std::forward<Args>(args)...));
        };

        if (m_states.empty())
        {
            report("the automaton has no states");
        }
        if (!initial_state().has_value())
        {
            report("no initial state defined");
        }

        for (const auto& state : m_states)
        {
            if (state.m_id.empty())
            {
                report("state ids cannot be empty");
            }
            else if (state.m_id.find(',') != std::string::npos)
            {
                report("state id '{}' cannot contain ','", state.m_id);
            }
        }

        for (const auto& [key, to] : m_transitions)
        {
            if (!key.m_symbol.has_value())
            {
                report("epsilon transition {} -> {} is not allowed in a deterministic automaton", key.m_state, to);
            }
            else if (!m_alphabet.contains(key.m_symbol.value()))
            {
                report("symbol '{}' on {} -> {} is not in the alphabet", key.m_symbol.value(), key.m_state, to);
            }
        }
        return errors;
    }

    auto Automaton::has_state(std::string_view id) const -> bool
    {
        return state_position(id) != m_states.end();
    }

    auto Automaton::find_state(std::string_view id) const -> std::optional<State>
    {
        if (auto it = state_position(id); it != m_states.end())
        {
            return *it;
        }
        return std::nullopt;
    }

    auto Automaton::target(std::string_view from, const Symbol& symbol) const -> std::optional<std::string>
    {
        if (auto it = m_transitions.find(TransitionKey(from, symbol)); it != m_transitions.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    auto Automaton::initial_state() const -> std::optional<std::string>
    {
        if (auto it = ranges::find_if(m_states, &State::m_is_initial); it != m_states.end())
        {
            return it->m_id;
        }
        return std::nullopt;
    }

    auto Automaton::final_states() const -> std::vector<std::string>
    {
        std::vector<std::string> finals;
        ranges::copy(
            m_states
                | views::filter(&State::m_is_final)
                | views::transform(&State::m_id),
            std::back_inserter(finals)
        );
        return finals;
    }

    auto Automaton::is_final(std::string_view id) const -> bool
    {
        auto it = state_position(id);
        return it != m_states.end() && it->m_is_final;
    }

    auto Automaton::has_epsilon_transitions() const -> bool
    {
        return ranges::any_of(m_transitions, [](const auto& entry) { return !entry.first.m_symbol.has_value(); });
    }

    auto Automaton::transition_list() const -> std::vector<Transition>
    {
        std::vector<Transition> list;
        list.reserve(m_transitions.size());
        for (const auto& [key, to] : m_transitions)
        {
            list.emplace_back(key.m_state, key.m_symbol, to);
        }
        return list;
    }
}
