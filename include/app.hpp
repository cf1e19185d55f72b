#ifndef APP_H
#define APP_H

#include "errors.hpp"
#include "language.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace app
{
    struct Options
    {
        std::optional<std::filesystem::path> out_file;
        spdlog::level::level_enum log_level{spdlog::level::warn};
        language::ClosureLimits limits;
    };

    auto configure_logging(const Options& options) -> void;

    // prints the error on stderr and returns the process exit status
    auto handle_error(const dfa::Error& err) -> int;

    auto run_check(const std::filesystem::path& path, const std::vector<std::string>& inputs, const Options& options) -> int;

    auto run_trace(const std::filesystem::path& path, const std::string& input, const Options& options) -> int;

    auto run_table(const std::filesystem::path& path, const Options& options) -> int;

    auto run_convert(const std::filesystem::path& path, const Options& options) -> int;

    auto run_closure(const std::string& symbols, std::size_t max_length, bool positive, const Options& options) -> int;

    auto run_substrings(const std::string& input, const Options& options) -> int;

    auto run_shell(const Options& options) -> int;
}

#endif
