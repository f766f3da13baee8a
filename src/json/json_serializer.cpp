//! # JSON Serialization
//!
//! Compact and pretty-printed output, deep copies and equality for
//! `JsonValue`.

#include "json/json_value.hpp"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace docforge::json {

auto JsonError::to_string() const -> std::string {
    std::ostringstream oss;
    oss << message;
    if (line > 0) {
        oss << " at line " << line << ", column " << column;
    }
    return oss.str();
}

auto escape_string(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size() + 2);
    for (char c : input) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }
    return result;
}

/// Shortest round-trip representation. NaN and infinities become `null`.
static auto format_double(double value) -> std::string {
    if (std::isnan(value) || std::isinf(value)) {
        return "null";
    }
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return "null";
    }
    std::string result(buf, ptr);
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

static void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    auto newline = [&](int level) {
        if (indent > 0) {
            out += '\n';
            out.append(static_cast<size_t>(indent * level), ' ');
        }
    };

    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_integer()) {
        out += std::to_string(value.as_i64());
    } else if (value.is_float()) {
        out += format_double(value.as_f64());
    } else if (value.is_string()) {
        out += '"';
        out += escape_string(value.as_string());
        out += '"';
    } else if (value.is_array()) {
        const auto& arr = value.as_array();
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(depth + 1);
            serialize(arr[i], out, indent, depth + 1);
        }
        if (!arr.empty()) {
            newline(depth);
        }
        out += ']';
    } else {
        const auto& obj = value.as_object();
        out += '{';
        bool first = true;
        for (const auto& [key, member] : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            newline(depth + 1);
            out += '"';
            out += escape_string(key);
            out += indent > 0 ? "\": " : "\":";
            serialize(member, out, indent, depth + 1);
        }
        if (!obj.empty()) {
            newline(depth);
        }
        out += '}';
    }
}

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, 0, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent, 0);
    return out;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_array()) {
        JsonArray copy;
        copy.reserve(as_array().size());
        for (const auto& item : as_array()) {
            copy.push_back(item.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_object()) {
        JsonObject copy;
        for (const auto& [key, member] : as_object()) {
            copy.emplace(key, member.clone());
        }
        return JsonValue(std::move(copy));
    }
    JsonValue result;
    std::visit(
        [&result](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (!std::is_same_v<T, Box<JsonArray>> &&
                          !std::is_same_v<T, Box<JsonObject>>) {
                result.data = v;
            }
        },
        data);
    return result;
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (is_number() && other.is_number()) {
        if (is_integer() && other.is_integer()) {
            return as_i64() == other.as_i64();
        }
        return as_f64() == other.as_f64();
    }
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (!(a[i] == b[i])) {
                return false;
            }
        }
        return true;
    }
    const auto& a = as_object();
    const auto& b = other.as_object();
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, member] : a) {
        auto it = b.find(key);
        if (it == b.end() || !(member == it->second)) {
            return false;
        }
    }
    return true;
}

auto JsonValue::get_string(const std::string& key) const -> std::optional<std::string> {
    const auto* member = get(key);
    if (member && member->is_string()) {
        return member->as_string();
    }
    return std::nullopt;
}

auto JsonValue::get_number(const std::string& key) const -> std::optional<double> {
    const auto* member = get(key);
    if (member && member->is_number()) {
        return member->as_f64();
    }
    return std::nullopt;
}

auto JsonValue::get_string_array(const std::string& key) const -> std::vector<std::string> {
    std::vector<std::string> result;
    const auto* member = get(key);
    if (member && member->is_array()) {
        for (const auto& item : member->as_array()) {
            if (item.is_string()) {
                result.push_back(item.as_string());
            }
        }
    }
    return result;
}

auto json_string_array(const std::vector<std::string>& items) -> JsonValue {
    auto arr = json_array();
    for (const auto& item : items) {
        arr.push(JsonValue(item));
    }
    return arr;
}

} // namespace docforge::json
