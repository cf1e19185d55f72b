#ifndef ERRORS_H
#define ERRORS_H

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>
#include <fmt/format.h>

namespace dfa
{
    enum class ErrorCode
    {
        DuplicateState,
        UnknownState,
        NonDeterministicTransition,
        NoInitialState,
        Parse,
        Schema,
        ResourceLimit,
        Validation,
        Io
    };

    struct Error
    {
        Error() = default;
        Error(ErrorCode code, std::string_view message)
            : m_code{code},
              m_message{message} {}

        auto operator==(const Error &) const -> bool = default;

        ErrorCode m_code{ErrorCode::Validation};
        std::string m_message;
    };

    template <typename T>
    using Result = tl::expected<T, Error>;

    // stable tag used when an error is shown to a user
    [[nodiscard]]
    auto to_string(ErrorCode code) -> std::string_view;

    [[nodiscard]]
    auto describe(const Error& error) -> std::string;

    template <typename... Args>
    [[nodiscard]]
    auto make_error(ErrorCode code, fmt::format_string<Args...> format, Args&&... args) -> tl::unexpected<Error>
    {
        return tl::unexpected<Error>(Error(code, fmt::format(format, std::forward<Args>(args)...)));
    }
}

#endif
