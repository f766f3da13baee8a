//! # Docstring Styles
//!
//! The three supported layouts and the section detection shared by the
//! critic and the scorer.
//!
//! | Style  | Template   | Parameters header            | Returns header      |
//! |--------|------------|------------------------------|---------------------|
//! | Google | `google/1` | `Args:`                      | `Returns:`/`Yields:`|
//! | NumPy  | `numpy/1`  | `Parameters` + dashed rule   | `Returns`/`Yields`  |
//! | reST   | `rst/1`    | `:param name:` fields        | `:returns:`/`:rtype:` |

#ifndef DOCFORGE_DOC_STYLE_HPP
#define DOCFORGE_DOC_STYLE_HPP

#include "analysis/code_element.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docforge::doc {

enum class DocStyle : uint8_t {
    Google,
    Numpy,
    Rest,
};

enum class Section : uint8_t {
    Parameters,
    Returns,
    Yields,
    Raises,
    Attributes,
};

/// Accepts "google", "numpy", "rst" and "restructuredtext" (any case).
[[nodiscard]] auto parse_style(std::string_view name) -> std::optional<DocStyle>;

/// "google", "numpy" or "rst".
[[nodiscard]] auto style_name(DocStyle style) -> std::string_view;

/// Versioned template id, e.g. "google/1".
[[nodiscard]] auto style_template_id(DocStyle style) -> std::string_view;

[[nodiscard]] auto section_name(Section section) -> std::string_view;

/// True when the block contains a header (or field) for `section`.
[[nodiscard]] auto has_section(DocStyle style, std::string_view block, Section section) -> bool;

/// Returns or Yields section present.
[[nodiscard]] auto has_return_section(DocStyle style, std::string_view block) -> bool;

/// Sections the element's facts call for: parameters when it has any, the
/// returns (or yields) section when it returns, raises when it raises.
[[nodiscard]] auto required_sections(const analysis::CodeElement& element)
    -> std::vector<Section>;

} // namespace docforge::doc

#endif // DOCFORGE_DOC_STYLE_HPP
