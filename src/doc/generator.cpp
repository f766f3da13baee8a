//! # Docstring Generator
//!
//! Rule-based rendering for the three styles and the completion round
//! trip with reply validation.

#include "doc/generator.hpp"

#include "analysis/element_json.hpp"
#include "doc/docstring.hpp"
#include "log/log.hpp"

#include <cctype>

namespace docforge::doc {

using analysis::CodeElement;
using analysis::ElementKind;
using analysis::Modifier;
using analysis::ParamKind;

namespace {

// ============================================================================
// Naming
// ============================================================================

auto split_words(std::string_view name) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string current;
    auto flush = [&] {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '_') {
            flush();
            continue;
        }
        bool upper = std::isupper(static_cast<unsigned char>(c)) != 0;
        bool prev_lower = i > 0 && std::islower(static_cast<unsigned char>(name[i - 1])) != 0;
        if (upper && prev_lower) {
            flush();
        }
        current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    flush();
    return words;
}

auto capitalize(std::string word) -> std::string {
    if (!word.empty()) {
        word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
    }
    return word;
}

auto join_words(const std::vector<std::string>& words) -> std::string {
    std::string result;
    for (const auto& word : words) {
        if (!result.empty()) {
            result += ' ';
        }
        result += word;
    }
    return result;
}

/// Name of the class owning a method, from its qualified name.
auto owner_name(const CodeElement& element) -> std::string {
    const auto& qualified = element.qualified_name;
    auto last_dot = qualified.rfind('.');
    if (last_dot == std::string::npos) {
        return element.name;
    }
    auto prev_dot = qualified.rfind('.', last_dot - 1);
    auto begin = prev_dot == std::string::npos ? 0 : prev_dot + 1;
    if (last_dot == 0) {
        return element.name;
    }
    return qualified.substr(begin, last_dot - begin);
}

auto param_display_name(const analysis::Parameter& param) -> std::string {
    switch (param.kind) {
    case ParamKind::VarPositional:
        return "*" + param.name;
    case ParamKind::VarKeyword:
        return "**" + param.name;
    default:
        return param.name;
    }
}

auto param_description(const analysis::Parameter& param) -> std::string {
    std::string text = "Description of " + param.name + ".";
    if (param.default_value) {
        text += " Defaults to " + embed_text(*param.default_value) + ".";
    }
    return text;
}

/// Element type of `Iterator[T]`, `Generator[T, ...]` and `Iterable[T]`.
auto yield_type(const std::optional<std::string>& type) -> std::optional<std::string> {
    if (!type) {
        return std::nullopt;
    }
    for (std::string_view prefix : {"Iterator[", "Generator[", "Iterable[", "AsyncIterator[",
                                    "AsyncGenerator[", "typing.Iterator[", "typing.Generator["}) {
        if (type->rfind(prefix, 0) != 0) {
            continue;
        }
        int depth = 0;
        for (size_t i = prefix.size(); i < type->size(); ++i) {
            char c = (*type)[i];
            if (c == '[') {
                ++depth;
            } else if (c == ']' || c == ',') {
                if (depth == 0) {
                    return type->substr(prefix.size(), i - prefix.size());
                }
                if (c == ']') {
                    --depth;
                }
            }
        }
    }
    return std::nullopt;
}

auto param_type(const analysis::Parameter& param) -> std::optional<std::string> {
    if (auto type = param.display_type()) {
        return embed_text(*type);
    }
    return std::nullopt;
}

/// Declared or inferred return type, or the yielded type for generators.
auto return_type(const analysis::ReturnInfo& returns) -> std::optional<std::string> {
    auto type = returns.is_generator ? yield_type(returns.display_type()) : returns.display_type();
    if (type) {
        return embed_text(*type);
    }
    return std::nullopt;
}

// ============================================================================
// Style Renderers
// ============================================================================

void add_blank(std::vector<std::string>& lines) {
    if (!lines.empty() && !lines.back().empty()) {
        lines.emplace_back();
    }
}

void render_google(const CodeElement& element, std::vector<std::string>& lines) {
    if (!element.parameters.empty()) {
        add_blank(lines);
        lines.emplace_back("Args:");
        for (const auto& param : element.parameters) {
            std::string line = "    " + param_display_name(param);
            if (auto type = param_type(param)) {
                line += " (" + *type + ")";
            }
            lines.push_back(line + ": " + param_description(param));
        }
    }
    if (element.returns) {
        add_blank(lines);
        auto type = return_type(*element.returns);
        if (element.returns->is_generator) {
            lines.emplace_back("Yields:");
            lines.push_back("    " + (type ? *type + ": " : std::string()) +
                            "Description of yielded values.");
        } else {
            lines.emplace_back("Returns:");
            lines.push_back("    " + (type ? *type + ": " : std::string()) +
                            "Description of return value.");
        }
    }
    if (!element.raises.empty()) {
        add_blank(lines);
        lines.emplace_back("Raises:");
        for (const auto& exc : element.raises) {
            lines.push_back("    " + exc.kind + ": Description of " + exc.kind + ".");
        }
    }
    if (!element.attributes.empty()) {
        add_blank(lines);
        lines.emplace_back("Attributes:");
        for (const auto& attr : element.attributes) {
            lines.push_back("    " + attr + ": Description of " + attr + ".");
        }
    }
}

void numpy_header(std::vector<std::string>& lines, const std::string& title) {
    add_blank(lines);
    lines.push_back(title);
    lines.emplace_back(title.size(), '-');
}

void render_numpy(const CodeElement& element, std::vector<std::string>& lines) {
    if (!element.parameters.empty()) {
        numpy_header(lines, "Parameters");
        for (const auto& param : element.parameters) {
            std::string line = param_display_name(param);
            if (auto type = param_type(param)) {
                line += " : " + *type;
                if (param.default_value) {
                    line += ", optional";
                }
            }
            lines.push_back(line);
            lines.push_back("    " + param_description(param));
        }
    }
    if (element.returns) {
        bool generator = element.returns->is_generator;
        numpy_header(lines, generator ? "Yields" : "Returns");
        auto type = return_type(*element.returns);
        if (type) {
            lines.push_back(*type);
            lines.push_back(generator ? "    Description of yielded values."
                                      : "    Description of return value.");
        } else {
            lines.emplace_back(generator ? "Description of yielded values."
                                         : "Description of return value.");
        }
    }
    if (!element.raises.empty()) {
        numpy_header(lines, "Raises");
        for (const auto& exc : element.raises) {
            lines.push_back(exc.kind);
            lines.push_back("    Description of " + exc.kind + ".");
        }
    }
    if (!element.attributes.empty()) {
        numpy_header(lines, "Attributes");
        for (const auto& attr : element.attributes) {
            lines.push_back(attr);
            lines.push_back("    Description of " + attr + ".");
        }
    }
}

void render_rest(const CodeElement& element, std::vector<std::string>& lines) {
    std::vector<std::string> fields;
    for (const auto& param : element.parameters) {
        fields.push_back(":param " + param.name + ": " + param_description(param));
        if (auto type = param_type(param)) {
            fields.push_back(":type " + param.name + ": " + *type);
        }
    }
    if (element.returns) {
        if (element.returns->is_generator) {
            fields.emplace_back(":yields: Description of yielded values.");
            if (auto type = return_type(*element.returns)) {
                fields.push_back(":ytype: " + *type);
            }
        } else {
            fields.emplace_back(":returns: Description of return value.");
            if (auto type = return_type(*element.returns)) {
                fields.push_back(":rtype: " + *type);
            }
        }
    }
    for (const auto& exc : element.raises) {
        fields.push_back(":raises " + exc.kind + ": Description of " + exc.kind + ".");
    }
    for (const auto& attr : element.attributes) {
        fields.push_back(":ivar " + attr + ": Description of " + attr + ".");
    }
    if (!fields.empty()) {
        add_blank(lines);
        lines.insert(lines.end(), fields.begin(), fields.end());
    }
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

auto summarize_name(const CodeElement& element) -> std::string {
    if (element.kind == ElementKind::Class) {
        return element.name + " class.";
    }
    if (element.kind == ElementKind::Constructor) {
        return "Initialize " + owner_name(element) + ".";
    }

    auto words = split_words(element.name);
    if (words.empty()) {
        return "Internal helper.";
    }
    if (element.modifiers.has(Modifier::Property)) {
        return "Return the " + join_words(words) + ".";
    }
    if (words.size() == 1) {
        return capitalize(words.front()) + " operation.";
    }
    return capitalize(join_words(words)) + ".";
}

auto render_rule_based(const CodeElement& element, DocStyle style) -> std::string {
    std::vector<std::string> lines;
    lines.push_back(summarize_name(element));
    switch (style) {
    case DocStyle::Google:
        render_google(element, lines);
        break;
    case DocStyle::Numpy:
        render_numpy(element, lines);
        break;
    case DocStyle::Rest:
        render_rest(element, lines);
        break;
    }
    return make_block(lines);
}

auto find_missing_fact(const CodeElement& element, std::string_view block)
    -> std::optional<std::string> {
    auto body = block_body(block);
    for (const auto& param : element.parameters) {
        if (!mentions(body, param.name)) {
            return param.name;
        }
    }
    for (const auto& exc : element.raises) {
        if (!mentions(body, exc.kind)) {
            return exc.kind;
        }
    }
    return std::nullopt;
}

Generator::Generator(Rc<backend::CompletionBackend> completion)
    : completion_(std::move(completion)) {}

auto Generator::generate(const CodeElement& element, DocStyle style,
                         const CriticReview* prior) const -> std::string {
    if (completion_) {
        if (auto text = complete(element, style, prior)) {
            return std::move(*text);
        }
    }
    return render_rule_based(element, style);
}

auto Generator::complete(const CodeElement& element, DocStyle style,
                         const CriticReview* prior) const -> std::optional<std::string> {
    backend::CompletionRequest request{
        .element = analysis::to_prompt_json(element),
        .style = std::string(style_template_id(style)),
        .skeleton = render_rule_based(element, style),
        .issues = prior ? prior->issues : std::vector<std::string>{},
        .suggestions = prior ? prior->suggestions : std::vector<std::string>{},
    };

    auto reply = completion_->complete(request);
    if (is_err(reply)) {
        DOCFORGE_LOG_WARN("generate", element.qualified_name
                                          << ": completion failed ("
                                          << unwrap_err(reply).message
                                          << "), using rule-based candidate");
        return std::nullopt;
    }

    auto block = normalize_block(unwrap(reply));
    if (!block) {
        DOCFORGE_LOG_WARN("generate", element.qualified_name
                                          << ": reply is not a single docstring block, using "
                                             "rule-based candidate");
        return std::nullopt;
    }
    if (auto missing = find_missing_fact(element, *block)) {
        DOCFORGE_LOG_WARN("generate", element.qualified_name << ": reply does not mention '"
                                                             << *missing
                                                             << "', using rule-based candidate");
        return std::nullopt;
    }
    return block;
}

} // namespace docforge::doc
