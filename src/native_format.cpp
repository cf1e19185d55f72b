#include "../include/serializer.hpp"
#include "../include/config.hpp"
#include "../include/json.hpp"
#include "../include/ranges_helpers.hpp"

#include <ranges>
#include <set>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace serializer
{
    // namespaces aliases
    namespace views  = std::views;
    namespace ranges = std::ranges;

    using dfa::ErrorCode;
    using dfa::make_error;
    using dfa::Result;

    namespace helpers
    {
        static auto indent(unsigned level) -> std::string
        {
            return std::string(level * dfa::config::json_indent, ' ');
        }

        static auto write_list(const std::vector<std::string>& items, unsigned level) -> std::string
        {
            if (items.empty())
            {
                return "[]";
            }
            return fmt::format(
                "[\n{}{}\n{}]",
                indent(level + 1),
                fmt::join(items | views::transform(json::quote), ",\n" + indent(level + 1)),
                indent(level)
            );
        }

        static auto write_transitions(const dfa::TransitionTable& transitions, unsigned level) -> std::string
        {
            if (transitions.empty())
            {
                return "{}";
            }
            auto entries = transitions | views::transform([](const auto& entry) {
                const auto& [key, to] = entry;
                std::string symbol = key.m_symbol.has_value() ? std::string(1, key.m_symbol.value()) : "";
                return fmt::format("{}: {}", json::quote(key.m_state + "," + symbol), json::quote(to));
            });
            return fmt::format(
                "{{\n{}{}\n{}}}",
                indent(level + 1),
                fmt::join(entries, ",\n" + indent(level + 1)),
                indent(level)
            );
        }

        static auto require(const json::Object& object, std::string_view field) -> Result<const json::Value*>
        {
            if (auto value = json::find(object, field); value != nullptr)
            {
                return value;
            }
            return make_error(ErrorCode::Schema, "missing required field '{}'", field);
        }

        static auto to_string_list(const json::Value& value, std::string_view field) -> Result<std::vector<std::string>>
        {
            if (!value.is_array())
            {
                return make_error(ErrorCode::Schema, "field '{}' must be an array, found {}", field, value.type_name());
            }

            auto to_string = [field](const json::Value& item) -> Result<std::string> {
                if (!item.is_string())
                {
                    return make_error(ErrorCode::Schema, "field '{}' must only hold strings, found {}", field, item.type_name());
                }
                return item.as_string();
            };
            return utility::to_expected(value.as_array() | views::transform(to_string));
        }

        // "state,symbol" where symbol is one character or empty for epsilon
        static auto split_key(std::string_view key) -> Result<dfa::TransitionKey>
        {
            const auto comma = key.find(',');
            if (comma == std::string_view::npos)
            {
                return make_error(ErrorCode::Schema, "transition key '{}' is not of the form 'state,symbol'", key);
            }

            auto state  = key.substr(0, comma);
            auto symbol = key.substr(comma + 1);
            if (symbol.size() > 1)
            {
                return make_error(ErrorCode::Schema, "transition key '{}' has a symbol longer than one character", key);
            }
            return dfa::TransitionKey(state, symbol.empty() ? dfa::epsilon : dfa::Symbol(symbol.front()));
        }

        static auto unknown_reference(std::string_view where, std::string_view id) -> tl::unexpected<dfa::Error>
        {
            return make_error(ErrorCode::Schema, "{} refers to unknown state '{}'", where, id);
        }
    }

    auto save_native(const dfa::Automaton& automaton) -> Result<std::string>
    {
        if (auto errors = automaton.validate(); !errors.empty())
        {
            return make_error(ErrorCode::Validation, "cannot save an invalid automaton: {}", errors.front().m_message);
        }

        auto alphabet = automaton.alphabet()
            | views::transform([](char c) { return std::string(1, c); })
            | utility::to<std::vector<std::string>>();
        auto states = automaton.states()
            | views::transform(&dfa::State::m_id)
            | utility::to<std::vector<std::string>>();

        const auto field = helpers::indent(1);
        return fmt::format(
            "{{\n"
            "{}\"alphabet\": {},\n"
            "{}\"states\": {},\n"
            "{}\"initial_state\": {},\n"
            "{}\"final_states\": {},\n"
            "{}\"transitions\": {}\n"
            "}}\n",
            field, helpers::write_list(alphabet, 1),
            field, helpers::write_list(states, 1),
            field, json::quote(automaton.initial_state().value_or("")),
            field, helpers::write_list(automaton.final_states(), 1),
            field, helpers::write_transitions(automaton.transitions(), 1)
        );
    }

    auto load_native(std::string_view text) -> Result<dfa::Automaton>
    {
        auto document = json::parse(text);
        if (!document)
        {
            return tl::unexpected<dfa::Error>(document.error());
        }
        if (!document->is_object())
        {
            return make_error(ErrorCode::Schema, "top level must be an object, found {}", document->type_name());
        }
        const auto& root = document->as_object();

        // schema pass: every field is present and well typed before anything is built
        auto alphabet_field    = helpers::require(root, "alphabet");
        auto states_field      = helpers::require(root, "states");
        auto initial_field     = helpers::require(root, "initial_state");
        auto finals_field      = helpers::require(root, "final_states");
        auto transitions_field = helpers::require(root, "transitions");
        for (const auto* field : {&alphabet_field, &states_field, &initial_field, &finals_field, &transitions_field})
        {
            if (!*field)
            {
                return tl::unexpected<dfa::Error>(field->error());
            }
        }

        auto alphabet = helpers::to_string_list(*alphabet_field.value(), "alphabet");
        if (!alphabet)
        {
            return tl::unexpected<dfa::Error>(alphabet.error());
        }
        auto states = helpers::to_string_list(*states_field.value(), "states");
        if (!states)
        {
            return tl::unexpected<dfa::Error>(states.error());
        }
        auto finals = helpers::to_string_list(*finals_field.value(), "final_states");
        if (!finals)
        {
            return tl::unexpected<dfa::Error>(finals.error());
        }

        const json::Value& initial = *initial_field.value();
        if (!initial.is_string() && !initial.is_null())
        {
            return make_error(ErrorCode::Schema, "field 'initial_state' must be a string, found {}", initial.type_name());
        }
        const json::Value& transitions = *transitions_field.value();
        if (!transitions.is_object())
        {
            return make_error(ErrorCode::Schema, "field 'transitions' must be an object, found {}", transitions.type_name());
        }

        // build pass
        dfa::Automaton automaton;
        for (const auto& symbol : alphabet.value())
        {
            if (symbol.size() != 1)
            {
                return make_error(ErrorCode::Schema, "alphabet entry '{}' is not a single character", symbol);
            }
            automaton.add_symbol(symbol.front());
        }

        for (const auto& id : states.value())
        {
            if (auto added = automaton.add_state(id); !added)
            {
                return tl::unexpected<dfa::Error>(added.error());
            }
        }

        if (initial.is_string() && !initial.as_string().empty())
        {
            if (!automaton.set_initial(initial.as_string()))
            {
                return helpers::unknown_reference("initial_state", initial.as_string());
            }
        }

        for (const auto& id : finals.value())
        {
            if (!automaton.set_final(id, true))
            {
                return helpers::unknown_reference("final_states", id);
            }
        }

        std::set<dfa::TransitionKey> seen;
        for (const auto& [key_text, target] : transitions.as_object())
        {
            auto key = helpers::split_key(key_text);
            if (!key)
            {
                return tl::unexpected<dfa::Error>(key.error());
            }
            if (!target.is_string())
            {
                return make_error(ErrorCode::Schema, "transition '{}' must map to a state id, found {}", key_text, target.type_name());
            }
            if (!automaton.has_state(key->m_state))
            {
                return helpers::unknown_reference(fmt::format("transition '{}'", key_text), key->m_state);
            }
            if (!automaton.has_state(target.as_string()))
            {
                return helpers::unknown_reference(fmt::format("transition '{}'", key_text), target.as_string());
            }

            if (!seen.insert(key.value()).second)
            {
                spdlog::warn("transition '{}' appears more than once, keeping the last target '{}'", key_text, target.as_string());
            }
            if (auto added = automaton.replace_transition(key->m_state, key->m_symbol, target.as_string()); !added)
            {
                return tl::unexpected<dfa::Error>(added.error());
            }
        }

        spdlog::info("loaded native automaton with {} states and {} transitions",
            automaton.states().size(), automaton.transitions().size());
        return automaton;
    }
}
