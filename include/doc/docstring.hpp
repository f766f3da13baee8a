//! # Docstring Blocks
//!
//! Text utilities over a candidate documentation block. A block is the
//! full literal including its `"""` delimiters, without indentation:
//!
//! ```text
//! """Compute total.
//!
//! Args:
//!     a (int): Description of a.
//! """
//! ```

#ifndef DOCFORGE_DOC_DOCSTRING_HPP
#define DOCFORGE_DOC_DOCSTRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docforge::doc {

constexpr std::string_view TRIPLE_QUOTE = R"(""")";

/// Word band a clear block must fall into.
constexpr size_t MIN_WORDS = 2;
constexpr size_t MAX_WORDS = 250;
constexpr size_t MAX_LINES = 80;

/// True when `block` starts and ends with `"""` and has room for both.
[[nodiscard]] auto is_delimited(std::string_view block) -> bool;

/// Text between the delimiters, or the whole block when it is not delimited.
[[nodiscard]] auto block_body(std::string_view block) -> std::string_view;

/// Words with at least one letter or digit in the block body.
[[nodiscard]] auto word_count(std::string_view block) -> size_t;

[[nodiscard]] auto line_count(std::string_view block) -> size_t;

/// Whole-word occurrence of `word` (identifier boundaries).
[[nodiscard]] auto mentions(std::string_view text, std::string_view word) -> bool;

/// Turns a free-form reply into one canonical block.
///
/// Accepts a bare text or a single `"""..."""` literal, optionally wrapped
/// in a Markdown code fence. The body is dedented and trailing whitespace
/// is stripped. Returns nullopt when the reply holds more than one literal,
/// an inner triple quote, a trailing backslash, or nothing at all.
[[nodiscard]] auto normalize_block(std::string_view reply) -> std::optional<std::string>;

/// Source text made safe inside a non-raw `"""` block. Backslashes are
/// doubled, every quote that follows a quote is escaped and whitespace runs
/// holding a line break collapse to one space. The result must not end a
/// one-line block.
[[nodiscard]] auto embed_text(std::string_view text) -> std::string;

/// Builds a block from body lines: one-line form when there is one line.
[[nodiscard]] auto make_block(const std::vector<std::string>& lines) -> std::string;

/// Splits `text` on '\n', dropping a trailing '\r' from each line.
[[nodiscard]] auto split_lines(std::string_view text) -> std::vector<std::string_view>;

} // namespace docforge::doc

#endif // DOCFORGE_DOC_DOCSTRING_HPP
