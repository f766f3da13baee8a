#include "doc/style.hpp"

#include "doc/docstring.hpp"

#include <algorithm>
#include <cctype>

namespace docforge::doc {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

auto is_rule(std::string_view line) -> bool {
    auto text = trim(line);
    return text.size() >= 3 && std::all_of(text.begin(), text.end(), [](char c) { return c == '-'; });
}

auto google_headers(Section section) -> std::vector<std::string_view> {
    switch (section) {
    case Section::Parameters:
        return {"Args:", "Arguments:", "Parameters:", "Params:"};
    case Section::Returns:
        return {"Returns:", "Return:"};
    case Section::Yields:
        return {"Yields:", "Yield:"};
    case Section::Raises:
        return {"Raises:"};
    case Section::Attributes:
        return {"Attributes:"};
    }
    return {};
}

auto numpy_headers(Section section) -> std::vector<std::string_view> {
    switch (section) {
    case Section::Parameters:
        return {"Parameters", "Other Parameters"};
    case Section::Returns:
        return {"Returns"};
    case Section::Yields:
        return {"Yields"};
    case Section::Raises:
        return {"Raises"};
    case Section::Attributes:
        return {"Attributes"};
    }
    return {};
}

auto rest_fields(Section section) -> std::vector<std::string_view> {
    switch (section) {
    case Section::Parameters:
        return {":param ", ":parameter ", ":arg "};
    case Section::Returns:
        return {":returns:", ":return:", ":rtype:"};
    case Section::Yields:
        return {":yields:", ":yield:", ":ytype:"};
    case Section::Raises:
        return {":raises ", ":raise ", ":raises:"};
    case Section::Attributes:
        return {":ivar ", ":var ", ":cvar "};
    }
    return {};
}

} // namespace

auto parse_style(std::string_view name) -> std::optional<DocStyle> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "google") {
        return DocStyle::Google;
    }
    if (lower == "numpy") {
        return DocStyle::Numpy;
    }
    if (lower == "rst" || lower == "restructuredtext" || lower == "rest") {
        return DocStyle::Rest;
    }
    return std::nullopt;
}

auto style_name(DocStyle style) -> std::string_view {
    switch (style) {
    case DocStyle::Google:
        return "google";
    case DocStyle::Numpy:
        return "numpy";
    case DocStyle::Rest:
        return "rst";
    }
    return "google";
}

auto style_template_id(DocStyle style) -> std::string_view {
    switch (style) {
    case DocStyle::Google:
        return "google/1";
    case DocStyle::Numpy:
        return "numpy/1";
    case DocStyle::Rest:
        return "rst/1";
    }
    return "google/1";
}

auto section_name(Section section) -> std::string_view {
    switch (section) {
    case Section::Parameters:
        return "parameters";
    case Section::Returns:
        return "returns";
    case Section::Yields:
        return "yields";
    case Section::Raises:
        return "raises";
    case Section::Attributes:
        return "attributes";
    }
    return "unknown";
}

auto has_section(DocStyle style, std::string_view block, Section section) -> bool {
    auto lines = split_lines(block_body(block));
    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = trim(lines[i]);
        switch (style) {
        case DocStyle::Google:
            for (auto header : google_headers(section)) {
                if (line == header) {
                    return true;
                }
            }
            break;
        case DocStyle::Numpy:
            for (auto header : numpy_headers(section)) {
                if (line == header && i + 1 < lines.size() && is_rule(lines[i + 1])) {
                    return true;
                }
            }
            break;
        case DocStyle::Rest:
            for (auto field : rest_fields(section)) {
                if (line.substr(0, field.size()) == field) {
                    return true;
                }
            }
            break;
        }
    }
    return false;
}

auto has_return_section(DocStyle style, std::string_view block) -> bool {
    return has_section(style, block, Section::Returns) || has_section(style, block, Section::Yields);
}

auto required_sections(const analysis::CodeElement& element) -> std::vector<Section> {
    std::vector<Section> sections;
    if (!element.parameters.empty()) {
        sections.push_back(Section::Parameters);
    }
    if (element.returns) {
        sections.push_back(element.returns->is_generator ? Section::Yields : Section::Returns);
    }
    if (!element.raises.empty()) {
        sections.push_back(Section::Raises);
    }
    return sections;
}

} // namespace docforge::doc
