//! # Source Text
//!
//! Owns the text of one Python file and answers position queries on it:
//! byte offset to line/column, line boundaries, and the file's line-ending
//! convention.
//!
//! ```cpp
//! Source source = Source::from_string("def f():\n    pass\n", "<test>");
//! SourceLocation loc = source.location(4); // line 1, column 5
//! std::string_view line = source.line(2);  // "    pass"
//! ```

#ifndef DOCFORGE_LEXER_SOURCE_HPP
#define DOCFORGE_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace docforge::lexer {

class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Character at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Text of a 1-based line without its terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    /// Byte offset where a 1-based line starts.
    [[nodiscard]] auto line_start(uint32_t line_num) const -> size_t;

    /// Byte offset just past the line's terminator (or end of text).
    [[nodiscard]] auto line_end(uint32_t line_num) const -> size_t;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// "\r\n" when the first line break of the file is CRLF, "\n" otherwise.
    [[nodiscard]] auto newline() const -> std::string_view {
        return crlf_ ? "\r\n" : "\n";
    }

    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.
    bool crlf_ = false;

    void build_line_index();
};

} // namespace docforge::lexer

#endif // DOCFORGE_LEXER_SOURCE_HPP
