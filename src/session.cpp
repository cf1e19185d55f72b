#include "../include/session.hpp"
#include "../include/serializer.hpp"

#include <spdlog/spdlog.h>

namespace app
{
    template <typename F>
    auto Session::edit(F&& mutation) -> dfa::Result<void>
    {
        auto result = std::forward<F>(mutation)(m_automaton);
        sync();
        return result;
    }

    auto Session::sync() -> void
    {
        if (m_trace.has_value() && m_trace_revision != m_automaton.revision())
        {
            spdlog::debug("automaton changed, discarding the current trace");
            m_trace.reset();
            m_cursor = 0;
        }
    }

    auto Session::add_state(std::string_view id, bool is_initial, bool is_final) -> dfa::Result<void>
    {
        return edit([&](dfa::Automaton& a) { return a.add_state(id, is_initial, is_final); });
    }

    auto Session::remove_state(std::string_view id) -> dfa::Result<void>
    {
        return edit([&](dfa::Automaton& a) { return a.remove_state(id); });
    }

    auto Session::set_initial(std::string_view id) -> dfa::Result<void>
    {
        return edit([&](dfa::Automaton& a) { return a.set_initial(id); });
    }

    auto Session::set_final(std::string_view id, bool flag) -> dfa::Result<void>
    {
        return edit([&](dfa::Automaton& a) { return a.set_final(id, flag); });
    }

    auto Session::add_symbol(char symbol) -> void
    {
        m_automaton.add_symbol(symbol);
        sync();
    }

    auto Session::add_transition(std::string_view from, const dfa::Symbol& symbol, std::string_view to) -> dfa::Result<void>
    {
        return edit([&](dfa::Automaton& a) { return a.add_transition(from, symbol, to); });
    }

    auto Session::remove_transition(std::string_view from, const dfa::Symbol& symbol) -> dfa::Result<void>
    {
        return edit([&](dfa::Automaton& a) { return a.remove_transition(from, symbol); });
    }

    auto Session::validate() const -> std::vector<dfa::Error>
    {
        return m_automaton.validate();
    }

    auto Session::reset() -> void
    {
        m_automaton.reset();
        m_trace.reset();
        m_cursor = 0;
    }

    auto Session::load(const std::filesystem::path& path) -> dfa::Result<void>
    {
        auto loaded = serializer::load_file(path);
        if (!loaded)
        {
            spdlog::debug("load of {} failed, keeping the current automaton", path.string());
            return tl::unexpected<dfa::Error>(loaded.error());
        }

        m_automaton = std::move(loaded.value());
        m_trace.reset();
        m_cursor = 0;
        return {};
    }

    auto Session::save(const std::filesystem::path& path) const -> dfa::Result<void>
    {
        return serializer::save_file(path, m_automaton);
    }

    auto Session::check(std::string_view input) -> dfa::Result<bool>
    {
        auto trace = dfa::build_trace(m_automaton, input);
        if (!trace)
        {
            return tl::unexpected<dfa::Error>(trace.error());
        }

        const bool accepted = trace->accepted();
        m_trace = std::move(trace.value());
        m_trace_revision = m_automaton.revision();
        m_cursor = dfa::reset_index();
        return accepted;
    }

    auto Session::next() -> std::size_t
    {
        if (m_trace.has_value())
        {
            m_cursor = dfa::next(m_trace.value(), m_cursor);
        }
        return m_cursor;
    }

    auto Session::prev() -> std::size_t
    {
        if (m_trace.has_value())
        {
            m_cursor = dfa::prev(m_trace.value(), m_cursor);
        }
        return m_cursor;
    }

    auto Session::rewind() -> std::size_t
    {
        m_cursor = dfa::reset_index();
        return m_cursor;
    }

    auto Session::current() const -> std::optional<dfa::Configuration>
    {
        if (!m_trace.has_value())
        {
            return std::nullopt;
        }
        return dfa::current_config(m_trace.value(), m_cursor);
    }

    auto Session::closure(std::string_view symbols, std::size_t max_length, bool include_empty) const
        -> dfa::Result<language::Closure>
    {
        return language::generate_closure(symbols, max_length, include_empty, m_limits);
    }
}
