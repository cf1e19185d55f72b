#include "../include/shell.hpp"
#include "../include/report.hpp"
#include "../include/ranges_helpers.hpp"

#include <algorithm>
#include <charconv>
#include <istream>
#include <ostream>
#include <ranges>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

namespace app
{
    // namespaces aliases
    namespace views  = std::views;
    namespace ranges = std::ranges;

    using dfa::ErrorCode;
    using dfa::make_error;

    namespace helpers
    {
        static auto tokenize(std::string_view line) -> std::vector<std::string>
        {
            return line
                | views::split(' ')
                | views::transform([](auto r) { return std::string(r.begin(), r.end()); })
                | views::filter([](const std::string& s) { return !s.empty(); })
                | utility::to<std::vector<std::string>>();
        }

        static auto to_bool(std::string_view str) -> dfa::Result<bool>
        {
            const static auto true_tokens  = {"1", "on", "yes", "true"};
            const static auto false_tokens = {"0", "off", "no", "false"};

            if (ranges::find(true_tokens, str) != true_tokens.end())
            {
                return true;
            }
            if (ranges::find(false_tokens, str) != false_tokens.end())
            {
                return false;
            }
            return make_error(ErrorCode::Parse, "'{}' is not on/off", str);
        }

        // one character, or "eps" for a lambda transition
        static auto to_symbol(std::string_view str) -> dfa::Result<dfa::Symbol>
        {
            if (str == "eps")
            {
                return dfa::epsilon;
            }
            if (str.size() != 1)
            {
                return make_error(ErrorCode::Parse, "'{}' is not a single symbol", str);
            }
            return dfa::Symbol(str.front());
        }

        static auto to_size(std::string_view str) -> dfa::Result<std::size_t>
        {
            std::size_t value = 0;
            auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
            if (ec != std::errc{} || end != str.data() + str.size())
            {
                return make_error(ErrorCode::Parse, "'{}' is not a non-negative integer", str);
            }
            return value;
        }

        static auto expect_arguments(const std::vector<std::string>& args, std::size_t min, std::size_t max, std::string_view usage)
            -> dfa::Result<void>
        {
            if (args.size() < min || args.size() > max)
            {
                return make_error(ErrorCode::Parse, "usage: {}", usage);
            }
            return {};
        }
    }

    Shell::Shell(Session& session, std::ostream& out, std::ostream& err)
        : m_session{session},
          m_out{out},
          m_err{err}
    {
    }

    auto Shell::execute(std::string_view line) -> bool
    {
        auto tokens = helpers::tokenize(line);
        if (tokens.empty() || tokens.front().starts_with('#'))
        {
            return true;
        }

        const std::string command = tokens.front();
        if (command == "quit" || command == "exit")
        {
            return false;
        }

        const Arguments args(tokens.begin() + 1, tokens.end());
        if (auto result = dispatch(command, args); !result)
        {
            ++m_failures;
            fmt::print(m_err, "{}\n", dfa::describe(result.error()));
        }
        return true;
    }

    auto Shell::run(std::istream& in, bool prompt) -> unsigned
    {
        std::string line;
        while (true)
        {
            if (prompt)
            {
                fmt::print(m_out, "dfa> ");
                m_out.flush();
            }
            if (!std::getline(in, line) || !execute(line))
            {
                break;
            }
        }
        return m_failures;
    }

    auto Shell::show_trace() -> void
    {
        if (const auto& trace = m_session.trace(); trace.has_value())
        {
            fmt::print(m_out, "{}\n{}\n",
                report::trace_listing(trace.value(), m_session.cursor()),
                report::position_line(trace.value(), m_session.cursor()));
        }
        else
        {
            fmt::print(m_out, "no string has been checked against the current automaton\n");
        }
    }

    auto Shell::show_help() -> void
    {
        fmt::print(m_out,
            "state ID [initial] [final]     add a state\n"
            "initial ID                     mark the initial state\n"
            "final ID [on|off]              mark or unmark a final state\n"
            "remove ID                      remove a state and its transitions\n"
            "symbol CHARS                   add symbols to the alphabet\n"
            "transition FROM SYMBOL TO      add a transition\n"
            "untransition FROM SYMBOL       remove a transition (SYMBOL may be eps)\n"
            "validate                       list what keeps the automaton from being a DFA\n"
            "table                          print the transition table\n"
            "check [STRING]                 validate a string and start a trace\n"
            "next | prev | rewind | where   walk the trace\n"
            "closure SYMBOLS LENGTH [plus]  enumerate the Kleene (or positive) closure\n"
            "substrings STRING              substrings, prefixes and suffixes\n"
            "load FILE | save FILE          read .afd/.jff, write .afd\n"
            "reset                          start over with an empty automaton\n"
            "quit\n");
    }

    auto Shell::dispatch(const std::string& command, const Arguments& args) -> dfa::Result<void>
    {
        spdlog::debug("shell command '{}' with {} argument(s)", command, args.size());

        if (command == "help")
        {
            show_help();
            return {};
        }
        if (command == "state")
        {
            return helpers::expect_arguments(args, 1, 3, "state ID [initial] [final]")
                .and_then([&]() -> dfa::Result<void> {
                    bool is_initial = false;
                    bool is_final = false;
                    for (const auto& flag : args | views::drop(1))
                    {
                        if (flag == "initial")    is_initial = true;
                        else if (flag == "final") is_final = true;
                        else return make_error(ErrorCode::Parse, "unknown state flag '{}'", flag);
                    }
                    return m_session.add_state(args[0], is_initial, is_final);
                });
        }
        if (command == "initial")
        {
            return helpers::expect_arguments(args, 1, 1, "initial ID")
                .and_then([&]() { return m_session.set_initial(args[0]); });
        }
        if (command == "final")
        {
            return helpers::expect_arguments(args, 1, 2, "final ID [on|off]")
                .and_then([&]() { return helpers::to_bool(args.size() == 2 ? args[1] : "on"); })
                .and_then([&](bool flag) { return m_session.set_final(args[0], flag); });
        }
        if (command == "remove")
        {
            return helpers::expect_arguments(args, 1, 1, "remove ID")
                .and_then([&]() { return m_session.remove_state(args[0]); });
        }
        if (command == "symbol")
        {
            return helpers::expect_arguments(args, 1, 1, "symbol CHARS")
                .map([&]() {
                    for (char c : args[0])
                    {
                        m_session.add_symbol(c);
                    }
                });
        }
        if (command == "transition")
        {
            return helpers::expect_arguments(args, 3, 3, "transition FROM SYMBOL TO")
                .and_then([&]() { return helpers::to_symbol(args[1]); })
                .and_then([&](const dfa::Symbol& symbol) { return m_session.add_transition(args[0], symbol, args[2]); });
        }
        if (command == "untransition")
        {
            return helpers::expect_arguments(args, 2, 2, "untransition FROM SYMBOL")
                .and_then([&]() { return helpers::to_symbol(args[1]); })
                .and_then([&](const dfa::Symbol& symbol) { return m_session.remove_transition(args[0], symbol); });
        }
        if (command == "validate")
        {
            fmt::print(m_out, "{}\n", report::validation_listing(m_session.validate()));
            return {};
        }
        if (command == "table")
        {
            fmt::print(m_out, "{}\n", report::transition_table(m_session.automaton()));
            return {};
        }
        if (command == "check")
        {
            return helpers::expect_arguments(args, 0, 1, "check [STRING]")
                .and_then([&]() { return m_session.check(args.empty() ? "" : args[0]); })
                .map([&](bool accepted) {
                    fmt::print(m_out, "{}\n", report::verdict(args.empty() ? "" : args[0], accepted));
                    show_trace();
                });
        }
        if (command == "next" || command == "prev" || command == "rewind" || command == "where")
        {
            if (command == "next")        m_session.next();
            else if (command == "prev")   m_session.prev();
            else if (command == "rewind") m_session.rewind();
            show_trace();
            return {};
        }
        if (command == "closure")
        {
            return helpers::expect_arguments(args, 2, 3, "closure SYMBOLS LENGTH [plus]")
                .and_then([&]() { return helpers::to_size(args[1]); })
                .and_then([&](std::size_t length) {
                    const bool positive = args.size() == 3 && args[2] == "plus";
                    return m_session.closure(args[0], length, !positive).map([&](const language::Closure& closure) {
                        fmt::print(m_out, "{}\n", report::closure_listing(positive ? "Positive closure (Σ+)" : "Kleene closure (Σ*)", closure));
                    });
                });
        }
        if (command == "substrings")
        {
            return helpers::expect_arguments(args, 1, 1, "substrings STRING")
                .map([&]() { fmt::print(m_out, "{}\n", report::decomposition_listing(language::decompose(args[0]))); });
        }
        if (command == "load")
        {
            return helpers::expect_arguments(args, 1, 1, "load FILE")
                .and_then([&]() { return m_session.load(args[0]); })
                .map([&]() { fmt::print(m_out, "loaded {}\n", args[0]); });
        }
        if (command == "save")
        {
            return helpers::expect_arguments(args, 1, 1, "save FILE")
                .and_then([&]() { return m_session.save(args[0]); })
                .map([&]() { fmt::print(m_out, "saved {}\n", args[0]); });
        }
        if (command == "reset")
        {
            m_session.reset();
            return {};
        }
        return make_error(ErrorCode::Parse, "unknown command '{}', try 'help'", command);
    }
}
