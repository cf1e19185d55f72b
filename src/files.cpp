#include "../include/serializer.hpp"
#include "../include/config.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

#include <spdlog/spdlog.h>

namespace serializer
{
    using dfa::ErrorCode;
    using dfa::make_error;
    using dfa::Result;

    auto format_from_path(const std::filesystem::path& path) -> Result<Format>
    {
        const auto extension = path.extension().string();
        if (extension == dfa::config::native_extension || extension == dfa::config::json_extension)
        {
            return Format::Native;
        }
        if (extension == dfa::config::jflap_extension)
        {
            return Format::Jflap;
        }
        return make_error(ErrorCode::Io, "unsupported file type '{}' for {}", extension, path.string());
    }

    auto read_text(const std::filesystem::path& path) -> Result<std::string>
    {
        if (path.empty())
        {
            return make_error(ErrorCode::Io, "empty path");
        }

        std::ifstream input(path, std::ios::in | std::ios::binary);
        if (!input)
        {
            return make_error(ErrorCode::Io, "could not open {}", path.string());
        }

        std::ostringstream contents;
        contents << input.rdbuf();
        if (input.bad())
        {
            return make_error(ErrorCode::Io, "could not read {}", path.string());
        }
        return contents.str();
    }

    auto write_text(const std::filesystem::path& path, std::string_view content) -> Result<void>
    {
        std::ofstream output(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!output)
        {
            return make_error(ErrorCode::Io, "could not open {} for writing", path.string());
        }

        output.write(content.data(), static_cast<std::streamsize>(content.size()));
        output.close();
        if (!output)
        {
            return make_error(ErrorCode::Io, "could not write {}", path.string());
        }
        return {};
    }

    auto load_file(const std::filesystem::path& path) -> Result<dfa::Automaton>
    {
        return format_from_path(path).and_then([&path](Format format) {
            return read_text(path).and_then([format](const std::string& text) {
                return format == Format::Native ? load_native(text) : load_jflap(text);
            });
        });
    }

    auto save_file(const std::filesystem::path& path, const dfa::Automaton& automaton) -> Result<void>
    {
        return save_native(automaton)
            .and_then([&path](const std::string& text) { return write_text(path, text); })
            .map([&path]() { spdlog::info("saved automaton to {}", path.string()); });
    }
}
