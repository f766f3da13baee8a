#include "analysis/element_json.hpp"

namespace docforge::analysis {

namespace {

using json::JsonValue;

auto optional_string(const std::optional<std::string>& value) -> JsonValue {
    return value ? JsonValue(*value) : json::json_null();
}

auto location_to_json(const SourceLocation& loc) -> JsonValue {
    auto obj = json::json_object();
    obj.set("line", JsonValue(static_cast<int64_t>(loc.line)));
    obj.set("column", JsonValue(static_cast<int64_t>(loc.column)));
    obj.set("offset", JsonValue(static_cast<int64_t>(loc.offset)));
    return obj;
}

auto span_to_json(const SourceSpan& span) -> JsonValue {
    auto obj = json::json_object();
    obj.set("start", location_to_json(span.start));
    obj.set("end", location_to_json(span.end));
    return obj;
}

void set_facts(JsonValue& obj, const CodeElement& element) {
    obj.set("kind", JsonValue(element_kind_to_string(element.kind)));
    obj.set("name", JsonValue(element.name));
    obj.set("qualified_name", JsonValue(element.qualified_name));

    auto params = json::json_array();
    for (const auto& param : element.parameters) {
        auto p = json::json_object();
        p.set("name", JsonValue(param.name));
        p.set("kind", JsonValue(param_kind_to_string(param.kind)));
        p.set("declared_type", optional_string(param.declared_type));
        p.set("inferred_type", optional_string(param.inferred_type));
        p.set("default", optional_string(param.default_value));
        params.push(std::move(p));
    }
    obj.set("parameters", std::move(params));
    obj.set("receiver", optional_string(element.receiver));

    if (element.returns) {
        auto ret = json::json_object();
        ret.set("declared_type", optional_string(element.returns->declared_type));
        ret.set("inferred_type", optional_string(element.returns->inferred_type));
        ret.set("is_generator", JsonValue(element.returns->is_generator));
        ret.set("is_multi_value", JsonValue(element.returns->is_multi_value));
        obj.set("returns", std::move(ret));
    } else {
        obj.set("returns", json::json_null());
    }

    auto raises = json::json_array();
    for (const auto& exc : element.raises) {
        auto e = json::json_object();
        e.set("kind", JsonValue(exc.kind));
        e.set("description", optional_string(exc.description));
        raises.push(std::move(e));
    }
    obj.set("raises", std::move(raises));

    obj.set("complexity", JsonValue(element.complexity_score));
    obj.set("modifiers", json::json_string_array(element.modifiers.names()));
    obj.set("decorators", json::json_string_array(element.decorators));
    obj.set("attributes", json::json_string_array(element.attributes));
    obj.set("body_digest", JsonValue(element.body_digest));
    obj.set("existing_doc",
            element.existing_doc ? JsonValue(element.existing_doc->value) : json::json_null());
}

} // namespace

auto to_json(const CodeElement& element) -> json::JsonValue {
    auto obj = json::json_object();
    set_facts(obj, element);
    obj.set("source_span", span_to_json(element.source_span));
    obj.set("decorator_span",
            element.decorator_span ? span_to_json(*element.decorator_span) : json::json_null());
    if (element.existing_doc) {
        obj.set("existing_doc_span", span_to_json(element.existing_doc->span));
    }
    auto insertion = json::json_object();
    insertion.set("offset", JsonValue(static_cast<int64_t>(element.insertion.offset)));
    insertion.set("indent", JsonValue(element.insertion.indent));
    insertion.set("inline_body", JsonValue(element.insertion.inline_body));
    obj.set("insertion", std::move(insertion));
    obj.set("warnings", json::json_string_array(element.warnings));
    return obj;
}

auto to_prompt_json(const CodeElement& element) -> json::JsonValue {
    auto obj = json::json_object();
    set_facts(obj, element);
    return obj;
}

} // namespace docforge::analysis
