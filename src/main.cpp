#include "../include/app.hpp"
#include "../include/config.hpp"

#include <iostream>
#include <string>

#include <argparse/argparse.hpp>

auto main(const int argc, char const * const * const argv) -> int
{
    argparse::ArgumentParser program("dfa_lab", std::string{dfa::config::version});
    program.add_description("Build, check and explore deterministic finite automata.");

    program.add_argument("-v", "--verbose")
        .help("Log every engine step.")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only log errors.")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-o", "--outfile")
        .help("Specify the file you wish to write the output to (optional)");
    program.add_argument("--max-strings")
        .help("Refuse closures projected to produce more strings than this.")
        .default_value(dfa::config::default_closure_ceiling)
        .scan<'u', std::size_t>();
    program.add_argument("--max-characters")
        .help("Refuse closures whose strings would hold more characters than this.")
        .default_value(dfa::config::default_closure_characters)
        .scan<'u', std::size_t>();

    argparse::ArgumentParser check_command("check");
    check_command.add_description("Report whether each string is accepted.");
    check_command.add_argument("-a", "--automaton")
        .required()
        .help("Specify the .afd or .jff automaton.");
    check_command.add_argument("strings")
        .help("Strings to validate.")
        .nargs(argparse::nargs_pattern::at_least_one);

    argparse::ArgumentParser trace_command("trace");
    trace_command.add_description("Print every configuration visited while reading a string.");
    trace_command.add_argument("-a", "--automaton")
        .required()
        .help("Specify the .afd or .jff automaton.");
    trace_command.add_argument("-s", "--string")
        .default_value(std::string{})
        .help("The string to replay.");

    argparse::ArgumentParser table_command("table");
    table_command.add_description("Print the transition table.");
    table_command.add_argument("-a", "--automaton")
        .required()
        .help("Specify the .afd or .jff automaton.");

    argparse::ArgumentParser convert_command("convert");
    convert_command.add_description("Write an automaton in the native .afd format.");
    convert_command.add_argument("-a", "--automaton")
        .required()
        .help("Specify the .afd or .jff automaton.");

    argparse::ArgumentParser closure_command("closure");
    closure_command.add_description("Enumerate the Kleene or positive closure of a set of symbols.");
    closure_command.add_argument("-s", "--symbols")
        .required()
        .help("The symbols, repeated ones count once.");
    closure_command.add_argument("-n", "--length")
        .help("Longest string to generate.")
        .default_value(dfa::config::default_closure_length)
        .scan<'u', std::size_t>();
    closure_command.add_argument("--positive")
        .help("Leave out the empty string.")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser substrings_command("substrings");
    substrings_command.add_description("List the substrings, prefixes and suffixes of a string.");
    substrings_command.add_argument("-s", "--string")
        .required()
        .help("The string to decompose.");

    argparse::ArgumentParser shell_command("shell");
    shell_command.add_description("Edit and simulate an automaton interactively.");

    program.add_subparser(check_command);
    program.add_subparser(trace_command);
    program.add_subparser(table_command);
    program.add_subparser(convert_command);
    program.add_subparser(closure_command);
    program.add_subparser(substrings_command);
    program.add_subparser(shell_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        std::exit(1);
    }

    // set up the optional arguments
    app::Options options;
    if (auto o = program.present("-o"))
    {
        options.out_file = std::filesystem::path{*o};
    }
    if (program.get<bool>("--verbose"))
    {
        options.log_level = spdlog::level::debug;
    }
    else if (program.get<bool>("--quiet"))
    {
        options.log_level = spdlog::level::err;
    }
    options.limits.m_max_strings = program.get<std::size_t>("--max-strings");
    options.limits.m_max_characters = program.get<std::size_t>("--max-characters");
    app::configure_logging(options);

    // run the chosen command
    if (program.is_subcommand_used(check_command))
    {
        return app::run_check(
            check_command.get("--automaton"),
            check_command.get<std::vector<std::string>>("strings"),
            options
        );
    }
    if (program.is_subcommand_used(trace_command))
    {
        return app::run_trace(trace_command.get("--automaton"), trace_command.get("--string"), options);
    }
    if (program.is_subcommand_used(table_command))
    {
        return app::run_table(table_command.get("--automaton"), options);
    }
    if (program.is_subcommand_used(convert_command))
    {
        return app::run_convert(convert_command.get("--automaton"), options);
    }
    if (program.is_subcommand_used(closure_command))
    {
        return app::run_closure(
            closure_command.get("--symbols"),
            closure_command.get<std::size_t>("--length"),
            closure_command.get<bool>("--positive"),
            options
        );
    }
    if (program.is_subcommand_used(substrings_command))
    {
        return app::run_substrings(substrings_command.get("--string"), options);
    }
    if (program.is_subcommand_used(shell_command))
    {
        return app::run_shell(options);
    }

    std::cerr << program;
    return 1;
}
