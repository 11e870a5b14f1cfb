// ---------------------------------------------------------------------------
// json_util.cpp
//
// 최소 JSON 헬퍼 구현.
// find_string_field 는 RFC 8259 문법을 따라 최상위 객체 전체를 한 번 훑으며,
// 구조가 깨진 입력은 어떤 필드도 반환하지 않는다 (all-or-nothing).
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <cstdio>

namespace {

constexpr int kMaxDepth = 32;

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ---------------------------------------------------------------------------
// JsonCursor
//   입력 위의 읽기 위치. 오류는 std::unexpected(message) 로 반환한다.
// ---------------------------------------------------------------------------
class JsonCursor {
public:
    explicit JsonCursor(std::string_view text) noexcept : text_{text} {}

    void skip_ws() noexcept {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            ++pos_;
        }
    }

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : text_[pos_]; }

    // 공백을 건너뛴 뒤 expected 문자이면 소비하고 true
    [[nodiscard]] bool consume(char expected) noexcept {
        skip_ws();
        if (peek() == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] std::expected<std::string, std::string> parse_string();
    [[nodiscard]] std::expected<void, std::string> skip_value(int depth);

private:
    [[nodiscard]] std::expected<std::uint32_t, std::string> parse_hex4();

    std::string_view text_;
    std::size_t      pos_{0};
};

std::expected<std::uint32_t, std::string> JsonCursor::parse_hex4() {
    if (text_.size() - pos_ < 4) {
        return std::unexpected(std::string{"truncated \\u escape"});
    }
    std::uint32_t value{0};
    for (int i = 0; i < 4; ++i) {
        const char c = text_[pos_++];
        value <<= 4;
        if (c >= '0' && c <= '9')      { value |= static_cast<std::uint32_t>(c - '0'); }
        else if (c >= 'a' && c <= 'f') { value |= static_cast<std::uint32_t>(c - 'a' + 10); }
        else if (c >= 'A' && c <= 'F') { value |= static_cast<std::uint32_t>(c - 'A' + 10); }
        else {
            return std::unexpected(std::string{"invalid hex digit in \\u escape"});
        }
    }
    return value;
}

std::expected<std::string, std::string> JsonCursor::parse_string() {
    skip_ws();
    if (peek() != '"') {
        return std::unexpected(std::string{"expected string"});
    }
    ++pos_;

    std::string out;
    while (pos_ < text_.size()) {
        const char c = text_[pos_++];
        if (c == '"') {
            return out;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return std::unexpected(std::string{"unescaped control character in string"});
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        if (at_end()) {
            break;
        }
        const char esc = text_[pos_++];
        switch (esc) {
            case '"':  out += '"';  break;
            case '\\': out += '\\'; break;
            case '/':  out += '/';  break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                auto cp = parse_hex4();
                if (!cp) {
                    return std::unexpected(cp.error());
                }
                std::uint32_t code_point = *cp;
                if (code_point >= 0xD800 && code_point <= 0xDBFF) {
                    // 상위 서로게이트 뒤에는 반드시 하위 서로게이트가 와야 한다
                    if (text_.substr(pos_, 2) != "\\u") {
                        return std::unexpected(std::string{"unpaired surrogate in \\u escape"});
                    }
                    pos_ += 2;
                    auto low = parse_hex4();
                    if (!low) {
                        return std::unexpected(low.error());
                    }
                    if (*low < 0xDC00 || *low > 0xDFFF) {
                        return std::unexpected(std::string{"unpaired surrogate in \\u escape"});
                    }
                    code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
                } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
                    return std::unexpected(std::string{"unpaired surrogate in \\u escape"});
                }
                append_utf8(out, code_point);
                break;
            }
            default:
                return std::unexpected(fmt::format("invalid escape '\\{}'", esc));
        }
    }
    return std::unexpected(std::string{"unterminated string"});
}

std::expected<void, std::string> JsonCursor::skip_value(int depth) {
    if (depth > kMaxDepth) {
        return std::unexpected(std::string{"nesting too deep"});
    }
    skip_ws();

    const char c = peek();
    if (c == '"') {
        auto s = parse_string();
        if (!s) {
            return std::unexpected(s.error());
        }
        return {};
    }

    if (c == '{') {
        ++pos_;
        if (consume('}')) {
            return {};
        }
        while (true) {
            auto key = parse_string();
            if (!key) {
                return std::unexpected(std::string{"expected object key"});
            }
            if (!consume(':')) {
                return std::unexpected(std::string{"expected ':' after object key"});
            }
            auto value = skip_value(depth + 1);
            if (!value) {
                return value;
            }
            if (consume(',')) { continue; }
            if (consume('}')) { return {}; }
            return std::unexpected(std::string{"expected ',' or '}' in object"});
        }
    }

    if (c == '[') {
        ++pos_;
        if (consume(']')) {
            return {};
        }
        while (true) {
            auto value = skip_value(depth + 1);
            if (!value) {
                return value;
            }
            if (consume(',')) { continue; }
            if (consume(']')) { return {}; }
            return std::unexpected(std::string{"expected ',' or ']' in array"});
        }
    }

    // number / true / false / null
    const std::size_t start = pos_;
    while (pos_ < text_.size()) {
        const char t = text_[pos_];
        const bool token_char = (t >= '0' && t <= '9') || (t >= 'a' && t <= 'z') ||
                                (t >= 'A' && t <= 'Z') || t == '+' || t == '-' || t == '.';
        if (!token_char) {
            break;
        }
        ++pos_;
    }
    const std::string_view token = text_.substr(start, pos_ - start);
    if (token.empty()) {
        return std::unexpected(at_end() ? std::string{"unexpected end of input"}
                                        : fmt::format("unexpected character '{}'", c));
    }
    const bool numeric = token.front() == '-' || (token.front() >= '0' && token.front() <= '9');
    if (!numeric && token != "true" && token != "false" && token != "null") {
        return std::unexpected(fmt::format("invalid literal '{}'", token));
    }
    return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// json_escape
// ---------------------------------------------------------------------------
std::string json_escape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]{};
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// find_string_field
// ---------------------------------------------------------------------------
std::expected<std::optional<std::string>, std::string>
find_string_field(std::string_view json, std::string_view key) {
    JsonCursor cur{json};

    if (!cur.consume('{')) {
        return std::unexpected(std::string{"body must be a JSON object"});
    }

    std::optional<std::string> found;
    bool                       seen = false;

    if (!cur.consume('}')) {
        while (true) {
            auto name = cur.parse_string();
            if (!name) {
                return std::unexpected(std::string{"expected object key"});
            }
            if (!cur.consume(':')) {
                return std::unexpected(std::string{"expected ':' after object key"});
            }

            if (!seen && *name == key) {
                seen = true;
                cur.skip_ws();
                if (cur.peek() != '"') {
                    return std::unexpected(fmt::format("field '{}' must be a string", key));
                }
                auto value = cur.parse_string();
                if (!value) {
                    return std::unexpected(value.error());
                }
                found = std::move(*value);
            } else {
                auto skipped = cur.skip_value(1);
                if (!skipped) {
                    return std::unexpected(skipped.error());
                }
            }

            if (cur.consume(',')) { continue; }
            if (cur.consume('}')) { break; }
            return std::unexpected(std::string{"expected ',' or '}' in object"});
        }
    }

    cur.skip_ws();
    if (!cur.at_end()) {
        return std::unexpected(std::string{"trailing characters after JSON object"});
    }
    return found;
}
