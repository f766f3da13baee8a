#include "pipeline/injector.hpp"

#include "doc/docstring.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <unordered_map>

namespace docforge::pipeline {

namespace {

struct Edit {
    uint32_t element_offset = 0;
    size_t start = 0;
    size_t end = 0;
    std::string text;
};

/// Terminator of `line`, or the file's dominant one when the line has none.
auto line_terminator(const lexer::Source& source, uint32_t line) -> std::string_view {
    auto content = source.content();
    auto end = source.line_end(line);
    if (end > 0 && content[end - 1] == '\n') {
        if (end > 1 && content[end - 2] == '\r') {
            return "\r\n";
        }
        return "\n";
    }
    return source.newline();
}

auto leading_whitespace(std::string_view line) -> std::string_view {
    auto end = line.find_first_not_of(" \t");
    return line.substr(0, end == std::string_view::npos ? line.size() : end);
}

auto replacement_edit(const lexer::Source& source, const analysis::CodeElement& element,
                      const DocstringResult& result) -> Edit {
    const auto& span = element.existing_doc->span;
    auto line = span.start.line;
    std::string_view indent = leading_whitespace(source.line(line));
    if (element.insertion.inline_body && line == element.source_span.start.line) {
        indent = element.insertion.indent;
    }
    return Edit{
        .element_offset = element.offset(),
        .start = span.start.offset,
        .end = span.end.offset,
        .text = indent_block(result.text, indent, line_terminator(source, line)),
    };
}

auto insertion_edit(const lexer::Source& source, const analysis::CodeElement& element,
                    const DocstringResult& result) -> Edit {
    const auto& point = element.insertion;
    auto header_line = source.location(point.offset).line;
    auto newline = line_terminator(source, header_line);
    std::string block = point.indent + indent_block(result.text, point.indent, newline);

    if (point.inline_body) {
        std::string text(newline);
        text += block;
        text += newline;
        text += point.indent;
        return Edit{
            .element_offset = element.offset(),
            .start = point.offset,
            .end = point.body_offset,
            .text = std::move(text),
        };
    }

    block += newline;
    return Edit{
        .element_offset = element.offset(),
        .start = point.offset,
        .end = point.offset,
        .text = std::move(block),
    };
}

} // namespace

auto indent_block(std::string_view block, std::string_view indent, std::string_view newline)
    -> std::string {
    auto lines = doc::split_lines(block);
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += newline;
            if (!lines[i].empty()) {
                out += indent;
            }
        }
        out += lines[i];
    }
    return out;
}

auto inject(const lexer::Source& source, const std::vector<analysis::CodeElement>& elements,
            const std::vector<DocstringResult>& results, const InjectOptions& options)
    -> std::string {
    std::string text(source.content());
    if (results.empty()) {
        return text;
    }

    std::unordered_map<uint32_t, const analysis::CodeElement*> by_offset;
    for (const auto& element : elements) {
        by_offset.emplace(element.offset(), &element);
    }

    std::vector<Edit> edits;
    for (const auto& result : results) {
        auto it = by_offset.find(result.element_offset);
        if (it == by_offset.end()) {
            DOCFORGE_LOG_DEBUG("inject", "no element at offset " << result.element_offset
                                                                 << " for " << result.element_name);
            continue;
        }
        const auto& element = *it->second;
        if (element.has_existing_doc() && !options.overwrite) {
            DOCFORGE_LOG_DEBUG("inject", element.qualified_name << " keeps its docstring");
            continue;
        }
        if (element.existing_doc) {
            edits.push_back(replacement_edit(source, element, result));
        } else {
            edits.push_back(insertion_edit(source, element, result));
        }
    }

    std::stable_sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) {
        if (a.element_offset != b.element_offset) {
            return a.element_offset > b.element_offset;
        }
        return a.start > b.start;
    });

    for (const auto& edit : edits) {
        text.replace(edit.start, edit.end - edit.start, edit.text);
    }
    DOCFORGE_LOG_DEBUG("inject", source.filename() << ": applied " << edits.size() << " edits");
    return text;
}

} // namespace docforge::pipeline
