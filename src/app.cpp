#include "../include/app.hpp"

#include "../include/report.hpp"
#include "../include/serializer.hpp"
#include "../include/session.hpp"
#include "../include/shell.hpp"
#include "../include/simulator.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace app
{
    // writes the result to the requested file, or to stdout
    static
    auto emit(const std::string& text, const Options& options) -> int
    {
        if (options.out_file.has_value())
        {
            std::ofstream output_file;
            output_file.open(options.out_file.value(), std::ios::out | std::ios::trunc);
            output_file << text << '\n';
            output_file.close();
            if (!output_file)
            {
                return handle_error(dfa::Error(dfa::ErrorCode::Io,
                    fmt::format("could not write {}", options.out_file->string())));
            }
        }
        else
        {
            fmt::print("{}\n", text);
        }
        return 0;
    }

    static
    auto stdin_is_terminal() -> bool
    {
#ifdef _WIN32
        return _isatty(_fileno(stdin)) != 0;
#else
        return isatty(fileno(stdin)) != 0;
#endif
    }

    auto configure_logging(const Options& options) -> void
    {
        // diagnostics go to stderr so that results on stdout stay clean
        auto logger = spdlog::stderr_color_mt("dfa_lab");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%^%l%$] %v");
        spdlog::set_level(options.log_level);
    }

    auto handle_error(const dfa::Error& err) -> int
    {
        fmt::print(stderr, "{}\n", dfa::describe(err));
        return 1;
    }

    auto run_check(const std::filesystem::path& path, const std::vector<std::string>& inputs, const Options& options) -> int
    {
        auto automaton = serializer::load_file(path);
        if (!automaton)
        {
            return handle_error(automaton.error());
        }

        std::vector<std::string> lines;
        for (const auto& input : inputs)
        {
            auto accepted = dfa::accept(automaton.value(), input);
            if (!accepted)
            {
                return handle_error(accepted.error());
            }
            lines.push_back(report::verdict(input, accepted.value()));
        }
        return emit(fmt::format("{}", fmt::join(lines, "\n")), options);
    }

    auto run_trace(const std::filesystem::path& path, const std::string& input, const Options& options) -> int
    {
        auto trace = serializer::load_file(path)
            .and_then([&input](const dfa::Automaton& automaton) { return dfa::build_trace(automaton, input); });
        if (!trace)
        {
            return handle_error(trace.error());
        }

        const auto last = trace->size() - 1;
        return emit(
            fmt::format(
                "{}\n{}\n{}",
                report::verdict(input, trace->accepted()),
                report::trace_listing(trace.value(), last),
                report::position_line(trace.value(), last)
            ),
            options
        );
    }

    auto run_table(const std::filesystem::path& path, const Options& options) -> int
    {
        auto automaton = serializer::load_file(path);
        if (!automaton)
        {
            return handle_error(automaton.error());
        }

        auto text = report::transition_table(automaton.value());
        if (auto problems = automaton->validate(); !problems.empty())
        {
            text += "\n\n" + report::validation_listing(problems);
        }
        return emit(text, options);
    }

    auto run_convert(const std::filesystem::path& path, const Options& options) -> int
    {
        auto text = serializer::load_file(path).and_then(serializer::save_native);
        if (!text)
        {
            return handle_error(text.error());
        }
        return emit(text.value(), options);
    }

    auto run_closure(const std::string& symbols, std::size_t max_length, bool positive, const Options& options) -> int
    {
        auto closure = language::generate_closure(symbols, max_length, !positive, options.limits);
        if (!closure)
        {
            return handle_error(closure.error());
        }
        return emit(
            report::closure_listing(positive ? "Positive closure (Σ+)" : "Kleene closure (Σ*)", closure.value()),
            options
        );
    }

    auto run_substrings(const std::string& input, const Options& options) -> int
    {
        return emit(report::decomposition_listing(language::decompose(input)), options);
    }

    auto run_shell(const Options& options) -> int
    {
        Session session(options.limits);
        Shell shell(session, std::cout, std::cerr);

        const bool interactive = stdin_is_terminal();
        if (interactive)
        {
            fmt::print("DFA.lab shell, type 'help' for the list of commands\n");
        }
        const auto failures = shell.run(std::cin, interactive);
        return interactive || failures == 0 ? 0 : 1;
    }
}
