#include "../include/errors.hpp"

#include <fmt/format.h>

namespace dfa
{
    auto to_string(ErrorCode code) -> std::string_view
    {
        switch (code)
        {
        case ErrorCode::DuplicateState:
            return "<DUPLICATE STATE>";
        case ErrorCode::UnknownState:
            return "<UNKNOWN STATE>";
        case ErrorCode::NonDeterministicTransition:
            return "<NON DETERMINISTIC TRANSITION>";
        case ErrorCode::NoInitialState:
            return "<NO INITIAL STATE>";
        case ErrorCode::Parse:
            return "<PARSE ERROR>";
        case ErrorCode::Schema:
            return "<SCHEMA ERROR>";
        case ErrorCode::ResourceLimit:
            return "<RESOURCE LIMIT>";
        case ErrorCode::Validation:
            return "<VALIDATION ERROR>";
        case ErrorCode::Io:
            return "<IO ERROR>";
        }
        return "<UNKNOWN ERROR>";
    }

    auto describe(const Error& error) -> std::string
    {
        return fmt::format("{} : {}", to_string(error.m_code), error.m_message);
    }
}
