//! # Rc File Parser
//!
//! Line-oriented reader for the `.docgenrc` TOML subset. Each line is a
//! comment, a `[section]` header or a `key = value` pair; anything else is
//! an error reported with its line number.

#include "config/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace docforge::config {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

auto is_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

/// Drops a trailing `#` comment that is not inside a string.
auto strip_comment(std::string_view line) -> std::string_view {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != 0) {
            if (c == '\\' && quote == '"') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

struct ValueError {
    std::string message;
};

class ValueReader {
public:
    explicit ValueReader(std::string_view text) : text_(text) {}

    auto read() -> Result<RcValue, ValueError> {
        skip_space();
        if (at_end()) {
            return ValueError{"missing value"};
        }
        auto value = read_value();
        if (is_err(value)) {
            return value;
        }
        skip_space();
        if (!at_end()) {
            return ValueError{"unexpected text after value: '" + std::string(text_.substr(pos_)) +
                              "'"};
        }
        return value;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= text_.size();
    }

    void skip_space() {
        while (!at_end() && (text_[pos_] == ' ' || text_[pos_] == '\t')) {
            ++pos_;
        }
    }

    auto read_value() -> Result<RcValue, ValueError> {
        char c = text_[pos_];
        if (c == '"' || c == '\'') {
            auto str = read_string();
            if (is_err(str)) {
                return unwrap_err(str);
            }
            return RcValue(std::move(unwrap(str)));
        }
        if (c == '[') {
            return read_array();
        }
        return read_bare();
    }

    auto read_string() -> Result<std::string, ValueError> {
        char quote = text_[pos_++];
        std::string out;
        while (!at_end()) {
            char c = text_[pos_++];
            if (c == quote) {
                return out;
            }
            if (c == '\\' && quote == '"') {
                if (at_end()) {
                    break;
                }
                char esc = text_[pos_++];
                switch (esc) {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                case '"':
                case '\\':
                    out += esc;
                    break;
                default:
                    return ValueError{std::string("unknown escape '\\") + esc + "'"};
                }
                continue;
            }
            out += c;
        }
        return ValueError{"unterminated string"};
    }

    auto read_array() -> Result<RcValue, ValueError> {
        ++pos_; // '['
        std::vector<std::string> items;
        while (true) {
            skip_space();
            if (at_end()) {
                return ValueError{"unterminated array"};
            }
            if (text_[pos_] == ']') {
                ++pos_;
                return RcValue(std::move(items));
            }
            if (text_[pos_] != '"' && text_[pos_] != '\'') {
                return ValueError{"arrays may only contain strings"};
            }
            auto item = read_string();
            if (is_err(item)) {
                return unwrap_err(item);
            }
            items.push_back(std::move(unwrap(item)));
            skip_space();
            if (!at_end() && text_[pos_] == ',') {
                ++pos_;
            } else if (at_end() || text_[pos_] != ']') {
                return ValueError{"expected ',' or ']' in array"};
            }
        }
    }

    auto read_bare() -> Result<RcValue, ValueError> {
        auto start = pos_;
        while (!at_end() && text_[pos_] != ' ' && text_[pos_] != '\t') {
            ++pos_;
        }
        std::string word(text_.substr(start, pos_ - start));
        if (word == "true") {
            return RcValue(true);
        }
        if (word == "false") {
            return RcValue(false);
        }
        std::string digits;
        for (char c : word) {
            if (c != '_') {
                digits += c;
            }
        }
        char* end = nullptr;
        double number = std::strtod(digits.c_str(), &end);
        if (!digits.empty() && end == digits.c_str() + digits.size()) {
            return RcValue(number);
        }
        return ValueError{"invalid value '" + word + "'"};
    }
};

} // namespace

auto parse_rc(std::string_view text, const std::string& path) -> Result<RcDocument, ConfigError> {
    RcDocument document{.path = path, .entries = {}};
    std::string section;

    std::istringstream stream{std::string(text)};
    std::string raw;
    uint32_t line_number = 0;
    while (std::getline(stream, raw)) {
        ++line_number;
        auto line = trim(strip_comment(raw));
        if (line.empty()) {
            continue;
        }

        auto error = [&](std::string message) {
            return ConfigError{.message = std::move(message), .origin = path, .line = line_number};
        };

        if (line.front() == '[') {
            if (line.back() != ']') {
                return error("unterminated section header");
            }
            auto name = trim(line.substr(1, line.size() - 2));
            if (!is_identifier(name)) {
                return error("invalid section name '" + std::string(name) + "'");
            }
            section = std::string(name);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            return error("expected 'key = value'");
        }
        auto key = trim(line.substr(0, eq));
        if (!is_identifier(key)) {
            return error("invalid key '" + std::string(key) + "'");
        }

        auto value = ValueReader(line.substr(eq + 1)).read();
        if (is_err(value)) {
            return error(unwrap_err(value).message);
        }

        document.entries.push_back(RcEntry{
            .key = section.empty() ? std::string(key) : section + "." + std::string(key),
            .value = std::move(unwrap(value)),
            .line = line_number,
        });
    }
    return document;
}

auto load_rc_file(const std::string& path) -> Result<RcDocument, ConfigError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ConfigError{.message = "cannot open configuration file", .origin = path, .line = 0};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_rc(buffer.str(), path);
}

} // namespace docforge::config
