//! # JSON Parser
//!
//! Recursive descent parser for RFC 8259 JSON. Tracks line and column for
//! error messages and rejects nesting deeper than `MAX_DEPTH`.

#include "json/json_value.hpp"

#include <charconv>
#include <cstdlib>

namespace docforge::json {

namespace {

constexpr size_t MAX_DEPTH = 256;

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    auto parse() -> Result<JsonValue, JsonError> {
        skip_whitespace();
        auto value = parse_value(0);
        if (is_err(value)) {
            return value;
        }
        skip_whitespace();
        if (pos_ < input_.size()) {
            return make_error("Unexpected trailing characters");
        }
        return value;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    auto make_error(std::string message) const -> JsonError {
        return JsonError{std::move(message), line_, column_};
    }

    auto peek() const -> char {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    void advance() {
        if (pos_ >= input_.size()) {
            return;
        }
        if (input_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }

    void skip_whitespace() {
        while (pos_ < input_.size()) {
            char c = input_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            advance();
        }
    }

    auto consume_literal(std::string_view word) -> bool {
        if (input_.substr(pos_, word.size()) != word) {
            return false;
        }
        for (size_t i = 0; i < word.size(); ++i) {
            advance();
        }
        return true;
    }

    auto parse_value(size_t depth) -> Result<JsonValue, JsonError> {
        if (depth > MAX_DEPTH) {
            return make_error("Nesting too deep");
        }
        char c = peek();
        switch (c) {
        case '{':
            return parse_object(depth);
        case '[':
            return parse_array(depth);
        case '"': {
            auto str = parse_string();
            if (is_err(str)) {
                return unwrap_err(str);
            }
            return JsonValue(std::move(unwrap(str)));
        }
        case 't':
            if (consume_literal("true")) {
                return JsonValue(true);
            }
            break;
        case 'f':
            if (consume_literal("false")) {
                return JsonValue(false);
            }
            break;
        case 'n':
            if (consume_literal("null")) {
                return JsonValue();
            }
            break;
        default:
            if (c == '-' || (c >= '0' && c <= '9')) {
                return parse_number();
            }
            break;
        }
        if (pos_ >= input_.size()) {
            return make_error("Unexpected end of input");
        }
        return make_error(std::string("Unexpected character '") + c + "'");
    }

    auto parse_object(size_t depth) -> Result<JsonValue, JsonError> {
        advance(); // '{'
        JsonObject obj;
        skip_whitespace();
        if (peek() == '}') {
            advance();
            return JsonValue(std::move(obj));
        }
        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                return make_error("Expected string key");
            }
            auto key = parse_string();
            if (is_err(key)) {
                return unwrap_err(key);
            }
            skip_whitespace();
            if (peek() != ':') {
                return make_error("Expected ':' after object key");
            }
            advance();
            skip_whitespace();
            auto value = parse_value(depth + 1);
            if (is_err(value)) {
                return value;
            }
            obj.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));
            skip_whitespace();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == '}') {
                advance();
                return JsonValue(std::move(obj));
            }
            return make_error("Expected ',' or '}' in object");
        }
    }

    auto parse_array(size_t depth) -> Result<JsonValue, JsonError> {
        advance(); // '['
        JsonArray arr;
        skip_whitespace();
        if (peek() == ']') {
            advance();
            return JsonValue(std::move(arr));
        }
        while (true) {
            skip_whitespace();
            auto value = parse_value(depth + 1);
            if (is_err(value)) {
                return value;
            }
            arr.push_back(std::move(unwrap(value)));
            skip_whitespace();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == ']') {
                advance();
                return JsonValue(std::move(arr));
            }
            return make_error("Expected ',' or ']' in array");
        }
    }

    static void append_utf8(std::string& out, uint32_t cp) {
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

    auto parse_hex4() -> std::optional<uint32_t> {
        if (pos_ + 4 > input_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(input_.data() + pos_, input_.data() + pos_ + 4, value, 16);
        if (ec != std::errc() || ptr != input_.data() + pos_ + 4) {
            return std::nullopt;
        }
        for (int i = 0; i < 4; ++i) {
            advance();
        }
        return value;
    }

    auto parse_string() -> Result<std::string, JsonError> {
        advance(); // opening quote
        std::string out;
        while (true) {
            if (pos_ >= input_.size()) {
                return make_error("Unterminated string");
            }
            char c = input_[pos_];
            if (c == '"') {
                advance();
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return make_error("Control character in string");
            }
            if (c != '\\') {
                out += c;
                advance();
                continue;
            }
            advance();
            char esc = peek();
            advance();
            switch (esc) {
            case '"':
                out += '"';
                break;
            case '\\':
                out += '\\';
                break;
            case '/':
                out += '/';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'u': {
                auto cp = parse_hex4();
                if (!cp) {
                    return make_error("Invalid \\u escape");
                }
                uint32_t code = *cp;
                if (code >= 0xD800 && code <= 0xDBFF && peek() == '\\') {
                    advance();
                    if (peek() != 'u') {
                        return make_error("Invalid surrogate pair");
                    }
                    advance();
                    auto low = parse_hex4();
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                        return make_error("Invalid surrogate pair");
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                }
                append_utf8(out, code);
                break;
            }
            default:
                return make_error("Invalid escape sequence");
            }
        }
    }

    auto parse_number() -> Result<JsonValue, JsonError> {
        size_t start = pos_;
        bool is_float = false;
        if (peek() == '-') {
            advance();
        }
        if (!(peek() >= '0' && peek() <= '9')) {
            return make_error("Invalid number");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
        if (peek() == '.') {
            is_float = true;
            advance();
            if (!(peek() >= '0' && peek() <= '9')) {
                return make_error("Invalid number");
            }
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            is_float = true;
            advance();
            if (peek() == '+' || peek() == '-') {
                advance();
            }
            if (!(peek() >= '0' && peek() <= '9')) {
                return make_error("Invalid number exponent");
            }
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        }

        std::string text(input_.substr(start, pos_ - start));
        if (!is_float) {
            int64_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc() && ptr == text.data() + text.size()) {
                return JsonValue(value);
            }
        }
        return JsonValue(std::strtod(text.c_str(), nullptr));
    }
};

} // namespace

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace docforge::json
