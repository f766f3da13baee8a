#include "analysis/code_element.hpp"

namespace docforge::analysis {

auto element_kind_to_string(ElementKind kind) -> std::string_view {
    switch (kind) {
    case ElementKind::Function:
        return "function";
    case ElementKind::Method:
        return "method";
    case ElementKind::Constructor:
        return "constructor";
    case ElementKind::Class:
        return "class";
    }
    return "unknown";
}

auto modifier_to_string(Modifier modifier) -> std::string_view {
    switch (modifier) {
    case Modifier::Async:
        return "async";
    case Modifier::Decorated:
        return "decorated";
    case Modifier::StaticMethod:
        return "staticmethod";
    case Modifier::ClassMethod:
        return "classmethod";
    case Modifier::Property:
        return "property";
    case Modifier::Abstract:
        return "abstract";
    }
    return "unknown";
}

auto Modifiers::names() const -> std::vector<std::string> {
    static constexpr Modifier ALL[] = {Modifier::Async,       Modifier::Decorated,
                                       Modifier::StaticMethod, Modifier::ClassMethod,
                                       Modifier::Property,    Modifier::Abstract};
    std::vector<std::string> result;
    for (auto m : ALL) {
        if (has(m)) {
            result.emplace_back(modifier_to_string(m));
        }
    }
    return result;
}

auto param_kind_to_string(ParamKind kind) -> std::string_view {
    switch (kind) {
    case ParamKind::Positional:
        return "positional";
    case ParamKind::PositionalOnly:
        return "positional_only";
    case ParamKind::KeywordOnly:
        return "keyword_only";
    case ParamKind::VarPositional:
        return "var_positional";
    case ParamKind::VarKeyword:
        return "var_keyword";
    }
    return "unknown";
}

auto Parameter::display_type() const -> std::optional<std::string> {
    if (declared_type) {
        return declared_type;
    }
    if (inferred_type && *inferred_type != UNKNOWN_TYPE) {
        return inferred_type;
    }
    return std::nullopt;
}

auto ReturnInfo::display_type() const -> std::optional<std::string> {
    if (declared_type) {
        return declared_type;
    }
    if (inferred_type && *inferred_type != UNKNOWN_TYPE) {
        return inferred_type;
    }
    return std::nullopt;
}

} // namespace docforge::analysis
