#include "lexer/token.hpp"

#include <array>
#include <cstdlib>

namespace docforge::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Name:
        return "name";
    case TokenKind::Keyword:
        return "keyword";
    case TokenKind::Number:
        return "number";
    case TokenKind::String:
        return "string";
    case TokenKind::Operator:
        return "operator";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Indent:
        return "indent";
    case TokenKind::Dedent:
        return "dedent";
    case TokenKind::EndOfFile:
        return "end of file";
    }
    return "unknown";
}

auto is_hard_keyword(std::string_view word) -> bool {
    static constexpr std::array<std::string_view, 35> KEYWORDS = {
        "False", "None",   "True",    "and",      "as",       "assert", "async",
        "await", "break",  "class",   "continue", "def",      "del",    "elif",
        "else",  "except", "finally", "for",      "from",     "global", "if",
        "import", "in",    "is",      "lambda",   "nonlocal", "not",    "or",
        "pass",  "raise",  "return",  "try",      "while",    "with",   "yield"};
    for (auto kw : KEYWORDS) {
        if (kw == word) {
            return true;
        }
    }
    return false;
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

auto string_literal_value(const Token& token) -> std::string {
    std::string_view text = token.lexeme;
    size_t quote_len = token.string.triple ? 3 : 1;
    size_t skip = token.string.prefix_len + quote_len;
    if (text.size() < skip + quote_len) {
        return "";
    }
    std::string_view inner = text.substr(skip, text.size() - skip - quote_len);
    if (token.string.raw) {
        return std::string(inner);
    }

    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        char c = inner[i];
        if (c != '\\' || i + 1 >= inner.size()) {
            out += c;
            continue;
        }
        char esc = inner[++i];
        switch (esc) {
        case 'n':
            out += '\n';
            break;
        case 't':
            out += '\t';
            break;
        case 'r':
            out += '\r';
            break;
        case '\\':
            out += '\\';
            break;
        case '\'':
            out += '\'';
            break;
        case '"':
            out += '"';
            break;
        case 'a':
            out += '\a';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'v':
            out += '\v';
            break;
        case '\n':
            break;
        case '\r':
            if (i + 1 < inner.size() && inner[i + 1] == '\n') {
                ++i;
            }
            break;
        case 'x':
        case 'u':
        case 'U': {
            size_t digits = esc == 'x' ? 2 : (esc == 'u' ? 4 : 8);
            if (i + digits < inner.size()) {
                std::string hex(inner.substr(i + 1, digits));
                char* end = nullptr;
                unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
                if (hex.size() == digits && end == hex.c_str() + hex.size()) {
                    append_utf8(out, static_cast<uint32_t>(cp));
                    i += digits;
                    break;
                }
            }
            out += '\\';
            out += esc;
            break;
        }
        default:
            if (esc >= '0' && esc <= '7') {
                uint32_t value = static_cast<uint32_t>(esc - '0');
                for (int n = 0; n < 2 && i + 1 < inner.size() && inner[i + 1] >= '0' &&
                                inner[i + 1] <= '7';
                     ++n) {
                    value = value * 8 + static_cast<uint32_t>(inner[++i] - '0');
                }
                append_utf8(out, value);
            } else {
                out += '\\';
                out += esc;
            }
            break;
        }
    }
    return out;
}

} // namespace docforge::lexer
