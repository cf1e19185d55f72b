#ifndef SERIALIZER_H
#define SERIALIZER_H

#include "automaton.hpp"
#include "errors.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace serializer
{
    // Native .afd schema:
    //   {
    //     "alphabet": ["a", "b"],
    //     "states": ["q0", "q1"],
    //     "initial_state": "q0",
    //     "final_states": ["q1"],
    //     "transitions": { "q0,a": "q1", "q1,": "q0" }
    //   }
    // A transition key is "state,symbol"; an empty symbol is epsilon.

    // refuses automata that do not validate
    [[nodiscard]]
    auto save_native(const dfa::Automaton& automaton) -> dfa::Result<std::string>;

    // duplicated transition keys are resolved last-write-wins
    [[nodiscard]]
    auto load_native(std::string_view text) -> dfa::Result<dfa::Automaton>;

    // JFLAP .jff finite automaton; the whole load is rejected on the first
    // transition that would break determinism
    [[nodiscard]]
    auto load_jflap(std::string_view xml) -> dfa::Result<dfa::Automaton>;

    enum class Format
    {
        Native,
        Jflap
    };

    [[nodiscard]]
    auto format_from_path(const std::filesystem::path& path) -> dfa::Result<Format>;

    [[nodiscard]]
    auto read_text(const std::filesystem::path& path) -> dfa::Result<std::string>;

    [[nodiscard]]
    auto write_text(const std::filesystem::path& path, std::string_view content) -> dfa::Result<void>;

    [[nodiscard]]
    auto load_file(const std::filesystem::path& path) -> dfa::Result<dfa::Automaton>;

    [[nodiscard]]
    auto save_file(const std::filesystem::path& path, const dfa::Automaton& automaton) -> dfa::Result<void>;
}

#endif
