#ifndef SESSION_H
#define SESSION_H

#include "automaton.hpp"
#include "simulator.hpp"
#include "language.hpp"
#include "errors.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

namespace app
{
    // The single owner of the automaton being edited and of the latest
    // simulation. Front ends go through the session, never through the
    // model's collections. Any change to the model discards the trace.
    class Session
    {
    public:
        Session() = default;
        explicit Session(const language::ClosureLimits& limits)
            : m_limits{limits} {}

        // editing
        [[nodiscard]]
        auto add_state(std::string_view id, bool is_initial = false, bool is_final = false) -> dfa::Result<void>;

        [[nodiscard]]
        auto remove_state(std::string_view id) -> dfa::Result<void>;

        [[nodiscard]]
        auto set_initial(std::string_view id) -> dfa::Result<void>;

        [[nodiscard]]
        auto set_final(std::string_view id, bool flag) -> dfa::Result<void>;

        auto add_symbol(char symbol) -> void;

        [[nodiscard]]
        auto add_transition(std::string_view from, const dfa::Symbol& symbol, std::string_view to) -> dfa::Result<void>;

        [[nodiscard]]
        auto remove_transition(std::string_view from, const dfa::Symbol& symbol) -> dfa::Result<void>;

        [[nodiscard]]
        auto validate() const -> std::vector<dfa::Error>;

        auto reset() -> void;

        // persistence, a failed load leaves the current automaton untouched
        [[nodiscard]]
        auto load(const std::filesystem::path& path) -> dfa::Result<void>;

        [[nodiscard]]
        auto save(const std::filesystem::path& path) const -> dfa::Result<void>;

        // simulation
        [[nodiscard]]
        auto check(std::string_view input) -> dfa::Result<bool>;

        auto next() -> std::size_t;
        auto prev() -> std::size_t;
        auto rewind() -> std::size_t;

        [[nodiscard]]
        auto current() const -> std::optional<dfa::Configuration>;

        [[nodiscard]]
        auto trace() const -> const std::optional<dfa::Trace>& { return m_trace; }

        [[nodiscard]]
        auto cursor() const -> std::size_t { return m_cursor; }

        // language tools
        [[nodiscard]]
        auto closure(std::string_view symbols, std::size_t max_length, bool include_empty) const
            -> dfa::Result<language::Closure>;

        [[nodiscard]]
        auto automaton() const -> const dfa::Automaton& { return m_automaton; }

        [[nodiscard]]
        auto limits() const -> const language::ClosureLimits& { return m_limits; }

    private:
        // drops the trace if the model changed since it was built
        auto sync() -> void;

        template <typename F>
        auto edit(F&& mutation) -> dfa::Result<void>;

        dfa::Automaton m_automaton;
        std::optional<dfa::Trace> m_trace;
        std::size_t m_trace_revision{0};
        std::size_t m_cursor{0};
        language::ClosureLimits m_limits;
    };
}

#endif
