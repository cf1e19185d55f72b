#ifndef JSON_H
#define JSON_H

#include "errors.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// Minimal JSON document model used by the native .afd format. Objects keep
// their members in document order, duplicated keys included.
namespace serializer::json
{
    struct Value;
    struct Member;

    using Array  = std::vector<Value>;
    using Object = std::vector<Member>;

    struct Value
    {
        using Data = std::variant<std::nullptr_t, bool, double, std::string, Array, Object>;

        Value() = default;
        Value(Data data)
            : m_data{std::move(data)} {}

        [[nodiscard]] auto is_null() const -> bool   { return std::holds_alternative<std::nullptr_t>(m_data); }
        [[nodiscard]] auto is_string() const -> bool { return std::holds_alternative<std::string>(m_data); }
        [[nodiscard]] auto is_array() const -> bool  { return std::holds_alternative<Array>(m_data); }
        [[nodiscard]] auto is_object() const -> bool { return std::holds_alternative<Object>(m_data); }

        [[nodiscard]] auto as_string() const -> const std::string& { return std::get<std::string>(m_data); }
        [[nodiscard]] auto as_array() const -> const Array&        { return std::get<Array>(m_data); }
        [[nodiscard]] auto as_object() const -> const Object&      { return std::get<Object>(m_data); }

        // name of the held type, for error messages
        [[nodiscard]] auto type_name() const -> std::string_view;

        Data m_data{nullptr};
    };

    struct Member
    {
        std::string m_key;
        Value m_value;
    };

    [[nodiscard]]
    auto parse(std::string_view text) -> dfa::Result<Value>;

    // last member with the given key, or nullptr
    [[nodiscard]]
    auto find(const Object& object, std::string_view key) -> const Value*;

    // quoted and escaped string literal
    [[nodiscard]]
    auto quote(std::string_view s) -> std::string;
}

#endif
