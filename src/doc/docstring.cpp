#include "doc/docstring.hpp"

#include <algorithm>
#include <cctype>

namespace docforge::doc {

namespace {

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto rtrim(std::string_view text) -> std::string_view {
    auto end = text.find_last_not_of(" \t\r");
    return end == std::string_view::npos ? std::string_view{} : text.substr(0, end + 1);
}

/// Strips a surrounding ``` fence (with optional language tag).
auto strip_fence(std::string_view text) -> std::string_view {
    if (text.substr(0, 3) != "```") {
        return text;
    }
    auto first_newline = text.find('\n');
    auto closing = text.rfind("```");
    if (first_newline == std::string_view::npos || closing <= first_newline) {
        return text;
    }
    return trim(text.substr(first_newline + 1, closing - first_newline - 1));
}

} // namespace

auto is_delimited(std::string_view block) -> bool {
    return block.size() >= 2 * TRIPLE_QUOTE.size() && block.substr(0, 3) == TRIPLE_QUOTE &&
           block.substr(block.size() - 3) == TRIPLE_QUOTE;
}

auto block_body(std::string_view block) -> std::string_view {
    if (!is_delimited(block)) {
        return block;
    }
    return block.substr(3, block.size() - 6);
}

auto word_count(std::string_view block) -> size_t {
    auto body = block_body(block);
    size_t count = 0;
    bool in_word = false;
    bool has_alnum = false;
    for (size_t i = 0; i <= body.size(); ++i) {
        char c = i < body.size() ? body[i] : ' ';
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word && has_alnum) {
                ++count;
            }
            in_word = false;
            has_alnum = false;
        } else {
            in_word = true;
            has_alnum = has_alnum || std::isalnum(static_cast<unsigned char>(c));
        }
    }
    return count;
}

auto line_count(std::string_view block) -> size_t {
    if (block.empty()) {
        return 0;
    }
    return static_cast<size_t>(std::count(block.begin(), block.end(), '\n')) + 1;
}

auto mentions(std::string_view text, std::string_view word) -> bool {
    if (word.empty()) {
        return false;
    }
    size_t pos = 0;
    while ((pos = text.find(word, pos)) != std::string_view::npos) {
        bool left_ok = pos == 0 || !is_ident_char(text[pos - 1]);
        size_t end = pos + word.size();
        bool right_ok = end >= text.size() || !is_ident_char(text[end]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = end;
    }
    return false;
}

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        auto newline = text.find('\n', start);
        auto line = text.substr(start, newline == std::string_view::npos ? std::string_view::npos
                                                                         : newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (newline == std::string_view::npos) {
            break;
        }
        start = newline + 1;
    }
    return lines;
}

auto normalize_block(std::string_view reply) -> std::optional<std::string> {
    auto text = strip_fence(trim(reply));
    if (!text.empty() && (text.front() == 'r' || text.front() == 'R') &&
        text.substr(1, 3) == TRIPLE_QUOTE) {
        text.remove_prefix(1);
    }

    std::string_view inner;
    if (is_delimited(text)) {
        inner = block_body(text);
    } else if (text.find(TRIPLE_QUOTE) == std::string_view::npos) {
        inner = text;
    } else {
        return std::nullopt;
    }
    if (inner.find(TRIPLE_QUOTE) != std::string_view::npos) {
        return std::nullopt;
    }

    auto lines = split_lines(inner);

    // Common indentation of the continuation lines.
    size_t common = std::string_view::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        auto stripped = rtrim(lines[i]);
        if (stripped.empty()) {
            continue;
        }
        common = std::min(common, stripped.find_first_not_of(" \t"));
    }

    std::vector<std::string> body;
    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = rtrim(lines[i]);
        if (i == 0) {
            line = trim(line);
        } else if (common != std::string_view::npos && line.size() >= common) {
            line.remove_prefix(common);
        }
        body.emplace_back(line);
    }
    while (!body.empty() && body.front().empty()) {
        body.erase(body.begin());
    }
    while (!body.empty() && body.back().empty()) {
        body.pop_back();
    }
    // A trailing quote or backslash would fuse with the closing delimiter.
    if (body.empty() || body.back().back() == '\\' || body.back().back() == '"') {
        return std::nullopt;
    }
    return make_block(body);
}

auto embed_text(std::string_view text) -> std::string {
    auto is_blank = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    };
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (is_blank(c)) {
            size_t end = i;
            while (end < text.size() && is_blank(text[end])) {
                ++end;
            }
            auto run = text.substr(i, end - i);
            if (run.find_first_not_of(' ') == std::string_view::npos) {
                out.append(run);
            } else {
                out += ' ';
            }
            i = end;
            continue;
        }
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '"' && i > 0 && text[i - 1] == '"') {
            out += "\\\"";
        } else {
            out += c;
        }
        ++i;
    }
    return out;
}

auto make_block(const std::vector<std::string>& lines) -> std::string {
    std::string block(TRIPLE_QUOTE);
    if (lines.size() == 1) {
        block += lines.front();
        block += TRIPLE_QUOTE;
        return block;
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        block += lines[i];
        block += '\n';
    }
    block += TRIPLE_QUOTE;
    return block;
}

} // namespace docforge::doc
