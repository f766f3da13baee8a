//! # Element Serialization
//!
//! JSON form of a `CodeElement`, shared by the `analyze` command and by
//! the requests sent to external completion and evaluation commands.

#ifndef DOCFORGE_ANALYSIS_ELEMENT_JSON_HPP
#define DOCFORGE_ANALYSIS_ELEMENT_JSON_HPP

#include "analysis/code_element.hpp"
#include "json/json_value.hpp"

namespace docforge::analysis {

/// Full element facts including spans.
[[nodiscard]] auto to_json(const CodeElement& element) -> json::JsonValue;

/// Facts only, without spans and insertion data.
[[nodiscard]] auto to_prompt_json(const CodeElement& element) -> json::JsonValue;

} // namespace docforge::analysis

#endif // DOCFORGE_ANALYSIS_ELEMENT_JSON_HPP
