#ifndef AUTOMATON_H
#define AUTOMATON_H

#include "errors.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dfa
{
    // a symbol is a single character, std::nullopt is the epsilon (lambda) symbol
    using Symbol = std::optional<char>;

    inline constexpr Symbol epsilon = std::nullopt;

    [[nodiscard]]
    auto symbol_to_string(const Symbol& symbol) -> std::string;

    struct State
    {
        State() = default;
        State(
            std::string_view id,
            const bool is_initial,
            const bool is_final
        )
            : m_id{id},
              m_is_initial{is_initial},
              m_is_final{is_final} {}

        auto operator<=>(const State &) const = default;

        std::string m_id;
        bool m_is_initial{false};
        bool m_is_final{false};
    };

    struct TransitionKey
    {
        TransitionKey() = default;
        TransitionKey(
            std::string_view state,
            const Symbol& symbol
        )
            : m_state{state},
              m_symbol{symbol} {}

        auto operator<=>(const TransitionKey &) const = default;

        std::string m_state;
        Symbol m_symbol;
    };

    struct Transition
    {
        Transition() = default;
        Transition(
            std::string_view from,
            const Symbol& symbol,
            std::string_view to
        )
            : m_from{from},
              m_symbol{symbol},
              m_to{to} {}

        auto operator<=>(const Transition &) const = default;

        std::string m_from;
        Symbol m_symbol;
        std::string m_to;
    };

    using TransitionTable = std::map<TransitionKey, std::string>;

    // A deterministic finite automaton under construction. Every mutation
    // keeps the determinism invariant: a (state, symbol) pair maps to at most
    // one target state, and at most one state is marked initial.
    class Automaton
    {
    public:
        Automaton() = default;

        // structural equality, the revision counter is not compared
        auto operator==(const Automaton& other) const -> bool;

        // mutations
        [[nodiscard]]
        auto add_state(std::string_view id, bool is_initial = false, bool is_final = false) -> Result<void>;

        [[nodiscard]]
        auto remove_state(std::string_view id) -> Result<void>;

        [[nodiscard]]
        auto set_initial(std::string_view id) -> Result<void>;

        [[nodiscard]]
        auto set_final(std::string_view id, bool flag) -> Result<void>;

        auto add_symbol(char symbol) -> void;

        // re-adding an identical mapping succeeds without changes, mapping an
        // existing (from, symbol) pair to a different target is refused, and
        // so is epsilon
        [[nodiscard]]
        auto add_transition(std::string_view from, const Symbol& symbol, std::string_view to) -> Result<void>;

        // same determinism check, but keeps epsilon transitions found in foreign files
        [[nodiscard]]
        auto import_transition(std::string_view from, const Symbol& symbol, std::string_view to) -> Result<void>;

        // last-write-wins variant used when restoring saved files
        [[nodiscard]]
        auto replace_transition(std::string_view from, const Symbol& symbol, std::string_view to) -> Result<void>;

        [[nodiscard]]
        auto remove_transition(std::string_view from, const Symbol& symbol) -> Result<void>;

        auto reset() -> void;

        // queries
        [[nodiscard]]
        auto validate() const -> std::vector<Error>;

        [[nodiscard]]
        auto has_state(std::string_view id) const -> bool;

        [[nodiscard]]
        auto find_state(std::string_view id) const -> std::optional<State>;

        [[nodiscard]]
        auto target(std::string_view from, const Symbol& symbol) const -> std::optional<std::string>;

        [[nodiscard]]
        auto initial_state() const -> std::optional<std::string>;

        [[nodiscard]]
        auto final_states() const -> std::vector<std::string>;

        [[nodiscard]]
        auto is_final(std::string_view id) const -> bool;

        [[nodiscard]]
        auto has_epsilon_transitions() const -> bool;

        [[nodiscard]]
        auto transition_list() const -> std::vector<Transition>;

        [[nodiscard]]
        auto empty() const -> bool { return m_states.empty(); }

        [[nodiscard]]
        auto states() const -> const std::vector<State>& { return m_states; }

        [[nodiscard]]
        auto alphabet() const -> const std::set<char>& { return m_alphabet; }

        [[nodiscard]]
        auto transitions() const -> const TransitionTable& { return m_transitions; }

        [[nodiscard]]
        auto revision() const -> std::size_t { return m_revision; }

    private:
        auto state_position(std::string_view id) -> std::vector<State>::iterator;
        auto state_position(std::string_view id) const -> std::vector<State>::const_iterator;

        auto require_states(std::string_view from, std::string_view to) const -> Result<void>;

        auto touch() -> void { ++m_revision; }

        std::vector<State> m_states;
        std::set<char> m_alphabet;
        TransitionTable m_transitions;
        std::size_t m_revision{0};
    };
}

#endif
