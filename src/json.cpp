#include "../include/json.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <ranges>

#include <fmt/format.h>

namespace serializer::json
{
    namespace ranges = std::ranges;

    using dfa::ErrorCode;
    using dfa::make_error;
    using dfa::Result;

    namespace
    {
        auto append_utf8(std::string& out, std::uint32_t code_point) -> void
        {
            if (code_point < 0x80)
            {
                out.push_back(static_cast<char>(code_point));
            }
            else if (code_point < 0x800)
            {
                out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else if (code_point < 0x10000)
            {
                out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
            }
        }

        class Reader
        {
        public:
            explicit Reader(std::string_view text)
                : m_text{text} {}

            auto document() -> Result<Value>
            {
                auto value = read_value(0);
                if (!value)
                {
                    return value;
                }
                skip_whitespace();
                if (m_pos != m_text.size())
                {
                    return fail("unexpected trailing characters");
                }
                return value;
            }

        private:
            static constexpr unsigned max_depth = 256;

            auto fail(std::string_view what) const -> tl::unexpected<dfa::Error>
            {
                return make_error(ErrorCode::Parse, "{} at offset {}", what, m_pos);
            }

            auto skip_whitespace() -> void
            {
                while (m_pos < m_text.size() && std::isspace(static_cast<unsigned char>(m_text[m_pos])))
                {
                    ++m_pos;
                }
            }

            auto consume(char c) -> bool
            {
                skip_whitespace();
                if (m_pos < m_text.size() && m_text[m_pos] == c)
                {
                    ++m_pos;
                    return true;
                }
                return false;
            }

            auto read_value(unsigned depth) -> Result<Value>
            {
                if (depth > max_depth)
                {
                    return fail("nesting too deep");
                }

                skip_whitespace();
                if (m_pos >= m_text.size())
                {
                    return fail("unexpected end of input");
                }

                switch (m_text[m_pos])
                {
                case '{':
                    return read_object(depth);
                case '[':
                    return read_array(depth);
                case '"':
                    return read_string().map([](std::string s) { return Value(std::move(s)); });
                case 't':
                    return read_literal("true", Value(true));
                case 'f':
                    return read_literal("false", Value(false));
                case 'n':
                    return read_literal("null", Value(nullptr));
                default:
                    return read_number();
                }
            }

            auto read_literal(std::string_view word, Value value) -> Result<Value>
            {
                if (m_text.substr(m_pos, word.size()) != word)
                {
                    return fail("invalid literal");
                }
                m_pos += word.size();
                return value;
            }

            auto read_number() -> Result<Value>
            {
                const std::size_t start = m_pos;
                auto is_number_char = [](char c) {
                    return std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
                };
                while (m_pos < m_text.size() && is_number_char(m_text[m_pos]))
                {
                    ++m_pos;
                }
                if (start == m_pos)
                {
                    return fail("unexpected character");
                }

                const std::string token{m_text.substr(start, m_pos - start)};
                char* end = nullptr;
                const double number = std::strtod(token.c_str(), &end);
                if (end != token.c_str() + token.size())
                {
                    return fail("invalid number");
                }
                return Value(number);
            }

            auto read_hex4() -> Result<std::uint32_t>
            {
                if (m_pos + 4 > m_text.size())
                {
                    return fail("truncated unicode escape");
                }
                std::uint32_t code = 0;
                for (std::size_t i = 0; i < 4; ++i)
                {
                    const char c = m_text[m_pos++];
                    code <<= 4;
                    if (c >= '0' && c <= '9')      code |= static_cast<std::uint32_t>(c - '0');
                    else if (c >= 'a' && c <= 'f') code |= static_cast<std::uint32_t>(c - 'a' + 10);
                    else if (c >= 'A' && c <= 'F') code |= static_cast<std::uint32_t>(c - 'A' + 10);
                    else return fail("invalid unicode escape");
                }
                return code;
            }

            auto read_string() -> Result<std::string>
            {
                if (!consume('"'))
                {
                    return fail("expected string");
                }

                std::string out;
                while (m_pos < m_text.size())
                {
                    const char c = m_text[m_pos++];
                    if (c == '"')
                    {
                        return out;
                    }
                    if (static_cast<unsigned char>(c) < 0x20)
                    {
                        return fail("control character in string");
                    }
                    if (c != '\\')
                    {
                        out.push_back(c);
                        continue;
                    }

                    if (m_pos >= m_text.size())
                    {
                        break;
                    }
                    switch (const char escaped = m_text[m_pos++]; escaped)
                    {
                    case '"':  out.push_back('"');  break;
                    case '\\': out.push_back('\\'); break;
                    case '/':  out.push_back('/');  break;
                    case 'b':  out.push_back('\b'); break;
                    case 'f':  out.push_back('\f'); break;
                    case 'n':  out.push_back('\n'); break;
                    case 'r':  out.push_back('\r'); break;
                    case 't':  out.push_back('\t'); break;
                    case 'u':
                    {
                        auto code = read_hex4();
                        if (!code)
                        {
                            return tl::unexpected<dfa::Error>(code.error());
                        }
                        std::uint32_t code_point = code.value();
                        // surrogate pair
                        if (code_point >= 0xD800 && code_point <= 0xDBFF)
                        {
                            if (m_text.substr(m_pos, 2) != "\\u")
                            {
                                return fail("unpaired surrogate");
                            }
                            m_pos += 2;
                            auto low = read_hex4();
                            if (!low)
                            {
                                return tl::unexpected<dfa::Error>(low.error());
                            }
                            if (low.value() < 0xDC00 || low.value() > 0xDFFF)
                            {
                                return fail("invalid surrogate pair");
                            }
                            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low.value() - 0xDC00);
                        }
                        append_utf8(out, code_point);
                        break;
                    }
                    default:
                        return fail("invalid escape sequence");
                    }
                }
                return fail("unterminated string");
            }

            auto read_array(unsigned depth) -> Result<Value>
            {
                consume('[');
                Array items;
                if (consume(']'))
                {
                    return Value(std::move(items));
                }
                do
                {
                    auto item = read_value(depth + 1);
                    if (!item)
                    {
                        return item;
                    }
                    items.push_back(std::move(item.value()));
                } while (consume(','));

                if (!consume(']'))
                {
                    return fail("expected ',' or ']'");
                }
                return Value(std::move(items));
            }

            auto read_object(unsigned depth) -> Result<Value>
            {
                consume('{');
                Object members;
                if (consume('}'))
                {
                    return Value(std::move(members));
                }
                do
                {
                    auto key = read_string();
                    if (!key)
                    {
                        return tl::unexpected<dfa::Error>(key.error());
                    }
                    if (!consume(':'))
                    {
                        return fail("expected ':'");
                    }
                    auto value = read_value(depth + 1);
                    if (!value)
                    {
                        return value;
                    }
                    members.push_back(Member{std::move(key.value()), std::move(value.value())});
                } while (consume(','));

                if (!consume('}'))
                {
                    return fail("expected ',' or '}'");
                }
                return Value(std::move(members));
            }

            std::string_view m_text;
            std::size_t m_pos{0};
        };
    }

    auto Value::type_name() const -> std::string_view
    {
        switch (m_data.index())
        {
        case 0:  return "null";
        case 1:  return "boolean";
        case 2:  return "number";
        case 3:  return "string";
        case 4:  return "array";
        default: return "object";
        }
    }

    auto parse(std::string_view text) -> Result<Value>
    {
        return Reader(text).document();
    }

    auto find(const Object& object, std::string_view key) -> const Value*
    {
        auto matches = ranges::find(object.rbegin(), object.rend(), key, &Member::m_key);
        return matches == object.rend() ? nullptr : &matches->m_value;
    }

    auto quote(std::string_view s) -> std::string
    {
        std::string out{"\""};
        for (char c : s)
        {
            switch (c)
            {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
                }
                else
                {
                    out.push_back(c);
                }
            }
        }
        out.push_back('"');
        return out;
    }
}
