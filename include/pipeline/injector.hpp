//! # Injector
//!
//! Writes accepted blocks back into source text. Edits are applied in
//! descending order of element start offset so that earlier offsets stay
//! valid, and every byte outside the edited ranges is preserved.
//!
//! | Element state                    | Edit                                   |
//! |----------------------------------|----------------------------------------|
//! | no docstring                     | insert after the header line           |
//! | no docstring, inline body        | block and body each on their own line  |
//! | docstring, `overwrite`           | replace exactly the literal span       |
//! | non-empty docstring, no overwrite| untouched                              |

#ifndef DOCFORGE_PIPELINE_INJECTOR_HPP
#define DOCFORGE_PIPELINE_INJECTOR_HPP

#include "analysis/code_element.hpp"
#include "lexer/source.hpp"
#include "pipeline/orchestrator.hpp"

#include <string>
#include <vector>

namespace docforge::pipeline {

struct InjectOptions {
    bool overwrite = false;
};

/// Rewritten text. Results are matched to elements by `element_offset`;
/// results without a matching element are ignored.
[[nodiscard]] auto inject(const lexer::Source& source,
                          const std::vector<analysis::CodeElement>& elements,
                          const std::vector<DocstringResult>& results,
                          const InjectOptions& options = {}) -> std::string;

/// Block lines joined with `newline`; every non-empty line after the first
/// gets `indent`.
[[nodiscard]] auto indent_block(std::string_view block, std::string_view indent,
                                std::string_view newline) -> std::string;

} // namespace docforge::pipeline

#endif // DOCFORGE_PIPELINE_INJECTOR_HPP
