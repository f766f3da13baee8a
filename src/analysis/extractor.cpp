//! # Element Extractor
//!
//! Scope-aware walk of the module AST. Body facts (raise sites, return
//! values, yields) come from a `ScopeWalker` so nested definitions never
//! leak into their parent's element.

#include "analysis/extractor.hpp"

#include "analysis/inference.hpp"
#include "analysis/walker.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>

namespace docforge::analysis {

namespace {

constexpr size_t DIGEST_STATEMENTS = 3;
constexpr size_t DIGEST_MAX_CHARS = 200;

/// `a.b.c` for name and attribute chains, nullopt for anything else.
auto dotted_name(const parser::Expr& expr) -> std::optional<std::string> {
    if (expr.is<parser::NameExpr>()) {
        return expr.as<parser::NameExpr>().name;
    }
    if (expr.is<parser::AttributeExpr>()) {
        const auto& attr = expr.as<parser::AttributeExpr>();
        auto base = dotted_name(*attr.value);
        if (!base) {
            return std::nullopt;
        }
        return *base + "." + attr.attr;
    }
    return std::nullopt;
}

auto last_component(std::string_view dotted) -> std::string_view {
    auto dot = dotted.rfind('.');
    return dot == std::string_view::npos ? dotted : dotted.substr(dot + 1);
}

auto is_none(const parser::Expr& expr) -> bool {
    return expr.is<parser::ConstantExpr>() &&
           expr.as<parser::ConstantExpr>().kind == parser::ConstantKind::None;
}

/// Raise sites, return values and yields of one body.
class BodyFacts : public ScopeWalker {
public:
    bool returns_value = false;
    bool multi_value = false;
    bool yields = false;
    std::vector<ExceptionInfo> raises;

protected:
    void on_stmt(const parser::Stmt& stmt) override {
        if (stmt.is<parser::ReturnStmt>()) {
            const auto& ret = stmt.as<parser::ReturnStmt>();
            if (ret.value && !is_none(*ret.value)) {
                returns_value = true;
                if (ret.value->is<parser::CollectionExpr>() &&
                    ret.value->as<parser::CollectionExpr>().kind == parser::CollectionKind::Tuple) {
                    multi_value = true;
                }
            }
        } else if (stmt.is<parser::RaiseStmt>()) {
            record_raise(stmt.as<parser::RaiseStmt>());
        }
    }

    void on_expr(const parser::Expr& expr) override {
        if (expr.is<parser::YieldExpr>()) {
            yields = true;
        }
    }

private:
    void record_raise(const parser::RaiseStmt& raise) {
        if (!raise.exception) {
            return; // bare re-raise
        }
        const auto& exc = *raise.exception;
        std::optional<std::string> kind;
        std::optional<std::string> description;
        if (exc.is<parser::CallExpr>()) {
            const auto& call = exc.as<parser::CallExpr>();
            kind = dotted_name(*call.func);
            if (!call.args.empty() && !call.args[0].keyword && call.args[0].star == 0 &&
                call.args[0].value->is<parser::ConstantExpr>()) {
                const auto& message = call.args[0].value->as<parser::ConstantExpr>();
                if (message.kind == parser::ConstantKind::Str && !message.value.empty()) {
                    description = message.value;
                }
            }
        } else {
            kind = dotted_name(exc);
        }

        // Lower-case names are variables holding an exception instance.
        if (!kind || !std::isupper(static_cast<unsigned char>(last_component(*kind).front()))) {
            return;
        }
        bool seen = std::any_of(raises.begin(), raises.end(),
                                [&](const ExceptionInfo& info) { return info.kind == *kind; });
        if (!seen) {
            raises.push_back(ExceptionInfo{.kind = *kind, .description = description});
        }
    }
};

/// Instance attributes assigned through the receiver, first assignment first.
class AttributeCollector : public ScopeWalker {
public:
    explicit AttributeCollector(std::string receiver) : receiver_(std::move(receiver)) {}

    std::vector<std::string> names;

protected:
    void on_stmt(const parser::Stmt& stmt) override {
        if (stmt.is<parser::AssignStmt>()) {
            for (const auto& target : stmt.as<parser::AssignStmt>().targets) {
                record_target(*target);
            }
        }
    }

private:
    std::string receiver_;

    void record_target(const parser::Expr& target) {
        if (target.is<parser::CollectionExpr>()) {
            for (const auto& element : target.as<parser::CollectionExpr>().elements) {
                record_target(*element);
            }
            return;
        }
        if (!target.is<parser::AttributeExpr>()) {
            return;
        }
        const auto& attr = target.as<parser::AttributeExpr>();
        if (!attr.value->is<parser::NameExpr>() ||
            attr.value->as<parser::NameExpr>().name != receiver_) {
            return;
        }
        if (std::find(names.begin(), names.end(), attr.attr) == names.end()) {
            names.push_back(attr.attr);
        }
    }
};

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

/// Finds `__init__` among the direct (possibly conditional) class members.
auto find_constructor(const parser::Suite& body) -> const parser::FunctionDef* {
    for (const auto& stmt : body) {
        if (stmt->is<parser::FunctionDef>() && stmt->as<parser::FunctionDef>().name == "__init__") {
            return &stmt->as<parser::FunctionDef>();
        }
        if (stmt->is<parser::IfStmt>()) {
            const auto& branch = stmt->as<parser::IfStmt>();
            if (auto* init = find_constructor(branch.body)) {
                return init;
            }
            if (auto* init = find_constructor(branch.orelse)) {
                return init;
            }
        }
    }
    return nullptr;
}

} // namespace

// ============================================================================
// Extractor
// ============================================================================

Extractor::Extractor(const lexer::Source& source, ElementHook hook)
    : source_(source), hook_(std::move(hook)), indent_unit_(detect_indent_unit(source)) {}

auto Extractor::extract(const parser::Module& module) -> std::vector<CodeElement> {
    elements_.clear();
    visit_suite(module.body, Scope::Module, "");
    DOCFORGE_LOG_DEBUG("extract",
                       source_.filename() << ": " << elements_.size() << " elements extracted");
    return std::move(elements_);
}

void Extractor::visit_suite(const parser::Suite& suite, Scope scope, const std::string& prefix) {
    for (const auto& stmt : suite) {
        std::visit(
            [&](const auto& s) {
                using T = std::decay_t<decltype(s)>;
                using namespace parser;

                if constexpr (std::is_same_v<T, FunctionDef>) {
                    visit_function(*stmt, scope, prefix);
                } else if constexpr (std::is_same_v<T, ClassDef>) {
                    visit_class(*stmt, scope, prefix);
                } else if constexpr (std::is_same_v<T, IfStmt> || std::is_same_v<T, WhileStmt> ||
                                     std::is_same_v<T, ForStmt>) {
                    visit_suite(s.body, scope, prefix);
                    visit_suite(s.orelse, scope, prefix);
                } else if constexpr (std::is_same_v<T, TryStmt>) {
                    visit_suite(s.body, scope, prefix);
                    for (const auto& handler : s.handlers) {
                        visit_suite(handler.body, scope, prefix);
                    }
                    visit_suite(s.orelse, scope, prefix);
                    visit_suite(s.finalbody, scope, prefix);
                } else if constexpr (std::is_same_v<T, WithStmt>) {
                    visit_suite(s.body, scope, prefix);
                } else if constexpr (std::is_same_v<T, MatchStmt>) {
                    for (const auto& match_case : s.cases) {
                        visit_suite(match_case.body, scope, prefix);
                    }
                }
            },
            stmt->kind);
    }
}

void Extractor::visit_function(const parser::Stmt& stmt, Scope scope, const std::string& prefix) {
    const auto& func = stmt.as<parser::FunctionDef>();

    CodeElement element;
    if (scope == Scope::Class) {
        element.kind = func.name == "__init__" ? ElementKind::Constructor : ElementKind::Method;
    } else {
        element.kind = ElementKind::Function;
    }
    element.name = func.name;
    element.qualified_name = prefix + func.name;
    if (func.is_async) {
        element.modifiers.set(Modifier::Async);
    }
    collect_decorators(func.decorators, element);

    for (const auto& param : func.params) {
        element.parameters.push_back(Parameter{
            .name = param.name,
            .declared_type = text_of(param.annotation),
            .default_value = text_of(param.default_value),
            .inferred_type = std::nullopt,
            .kind = param.kind,
        });
    }
    bool bound = scope == Scope::Class && !element.modifiers.has(Modifier::StaticMethod);
    if (bound && !element.parameters.empty() &&
        (element.parameters.front().kind == ParamKind::Positional ||
         element.parameters.front().kind == ParamKind::PositionalOnly)) {
        element.receiver = element.parameters.front().name;
        element.parameters.erase(element.parameters.begin());
    }

    BodyFacts facts;
    facts.walk_suite(func.body);
    auto declared = text_of(func.returns);
    bool declared_value = declared && *declared != "None";
    if (declared_value || facts.returns_value || facts.yields) {
        element.returns = ReturnInfo{
            .declared_type = declared_value ? declared : std::optional<std::string>{},
            .inferred_type = std::nullopt,
            .is_generator = facts.yields,
            .is_multi_value = facts.multi_value,
        };
    }
    element.raises = std::move(facts.raises);

    element.existing_doc = find_docstring(func.body);
    element.source_span = stmt.span;
    if (func.decorator_start && !func.decorators.empty()) {
        element.decorator_span = SourceSpan{*func.decorator_start, func.decorators.back()->span.end};
    }
    element.insertion = insertion_point(func.layout, func.body, stmt.span);
    element.body_digest = digest(func.body);

    DOCFORGE_LOG_TRACE("extract", element_kind_to_string(element.kind)
                                      << " " << element.qualified_name << " at line "
                                      << stmt.span.start.line);
    if (hook_) {
        hook_(element, stmt);
    }
    elements_.push_back(std::move(element));

    visit_suite(func.body, Scope::Function, prefix + func.name + ".<locals>.");
}

void Extractor::visit_class(const parser::Stmt& stmt, Scope /*scope*/, const std::string& prefix) {
    const auto& cls = stmt.as<parser::ClassDef>();

    CodeElement element;
    element.kind = ElementKind::Class;
    element.name = cls.name;
    element.qualified_name = prefix + cls.name;
    collect_decorators(cls.decorators, element);

    for (const auto& base : cls.bases) {
        auto text = text_of(*base.value);
        if (text == "ABC" || text == "abc.ABC" || text == "ABCMeta" || text == "abc.ABCMeta") {
            element.modifiers.set(Modifier::Abstract);
        }
    }

    if (const auto* init = find_constructor(cls.body)) {
        std::string receiver = "self";
        if (!init->params.empty() && init->params.front().kind != ParamKind::VarPositional &&
            init->params.front().kind != ParamKind::VarKeyword) {
            receiver = init->params.front().name;
        }
        AttributeCollector attributes(receiver);
        attributes.walk_suite(init->body);
        element.attributes = std::move(attributes.names);
    }

    element.existing_doc = find_docstring(cls.body);
    element.source_span = stmt.span;
    if (cls.decorator_start && !cls.decorators.empty()) {
        element.decorator_span = SourceSpan{*cls.decorator_start, cls.decorators.back()->span.end};
    }
    element.insertion = insertion_point(cls.layout, cls.body, stmt.span);
    element.body_digest = digest(cls.body);

    DOCFORGE_LOG_TRACE("extract",
                       "class " << element.qualified_name << " at line " << stmt.span.start.line);
    if (hook_) {
        hook_(element, stmt);
    }
    elements_.push_back(std::move(element));

    visit_suite(cls.body, Scope::Class, prefix + cls.name + ".");
}

// ============================================================================
// Fact Collection
// ============================================================================

auto Extractor::text_of(const parser::Expr& expr) const -> std::string {
    return std::string(source_.slice(expr.span.start.offset, expr.span.end.offset));
}

auto Extractor::text_of(const parser::ExprPtr& expr) const -> std::optional<std::string> {
    if (!expr) {
        return std::nullopt;
    }
    return text_of(*expr);
}

void Extractor::collect_decorators(const std::vector<parser::ExprPtr>& decorators,
                                   CodeElement& element) const {
    for (const auto& decorator : decorators) {
        auto text = text_of(*decorator);
        element.modifiers.set(Modifier::Decorated);

        std::string_view target = text;
        if (auto paren = target.find('('); paren != std::string_view::npos) {
            target = target.substr(0, paren);
        }
        auto last = last_component(target);
        if (last == "staticmethod") {
            element.modifiers.set(Modifier::StaticMethod);
        } else if (last == "classmethod") {
            element.modifiers.set(Modifier::ClassMethod);
        } else if (last == "property" || last == "cached_property" || last == "setter" ||
                   last == "getter" || last == "deleter") {
            element.modifiers.set(Modifier::Property);
        } else if (last == "abstractmethod" || last == "abstractproperty") {
            element.modifiers.set(Modifier::Abstract);
        }
        element.decorators.push_back(std::move(text));
    }
}

auto Extractor::find_docstring(const parser::Suite& body) const -> std::optional<DocBlock> {
    if (body.empty() || !body.front()->is<parser::ExprStmt>()) {
        return std::nullopt;
    }
    const auto& expr = *body.front()->as<parser::ExprStmt>().expr;
    if (!expr.is<parser::ConstantExpr>() ||
        expr.as<parser::ConstantExpr>().kind != parser::ConstantKind::Str) {
        return std::nullopt;
    }
    return DocBlock{
        .raw = text_of(expr),
        .value = expr.as<parser::ConstantExpr>().value,
        .span = expr.span,
    };
}

auto Extractor::insertion_point(const parser::BlockLayout& layout, const parser::Suite& body,
                                const SourceSpan& span) const -> InsertionPoint {
    InsertionPoint point;
    if (layout.inline_body) {
        point.inline_body = true;
        point.offset = layout.colon_end;
        point.body_offset = body.empty() ? layout.colon_end : body.front()->span.start.offset;
        point.indent = indentation_of(span.start.line) + indent_unit_;
        return point;
    }
    point.offset = static_cast<uint32_t>(source_.line_end(layout.header_line));
    point.body_offset = point.offset;
    point.indent = body.empty() ? indentation_of(span.start.line) + indent_unit_
                                : indentation_of(body.front()->span.start.line);
    return point;
}

auto Extractor::digest(const parser::Suite& body) const -> std::string {
    std::string result;
    size_t taken = 0;
    for (size_t i = 0; i < body.size() && taken < DIGEST_STATEMENTS; ++i) {
        const auto& stmt = *body[i];
        if (i == 0 && find_docstring(body)) {
            continue;
        }
        auto line_end = source_.line_end(stmt.span.start.line);
        auto end = std::min<size_t>(stmt.span.end.offset, line_end);
        auto text = trim(source_.slice(stmt.span.start.offset, end));
        if (text.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += "; ";
        }
        result += text;
        ++taken;
    }
    if (result.size() > DIGEST_MAX_CHARS) {
        result.resize(DIGEST_MAX_CHARS - 3);
        result += "...";
    }
    return result;
}

auto Extractor::indentation_of(uint32_t line) const -> std::string {
    auto text = source_.line(line);
    auto end = text.find_first_not_of(" \t");
    return std::string(text.substr(0, end == std::string_view::npos ? text.size() : end));
}

// ============================================================================
// Entry Points
// ============================================================================

auto extract(const lexer::Source& source) -> Result<std::vector<CodeElement>, parser::ParseError> {
    auto module = parser::parse_source(source);
    if (is_err(module)) {
        const auto& err = unwrap_err(module);
        DOCFORGE_LOG_DEBUG("extract", source.filename() << ":" << err.span.start.line << ":"
                                                        << err.span.start.column << ": "
                                                        << err.message);
        return err;
    }
    Extractor extractor(source);
    return extractor.extract(unwrap(module));
}

auto analyze(const lexer::Source& source) -> Result<std::vector<CodeElement>, parser::ParseError> {
    auto module = parser::parse_source(source);
    if (is_err(module)) {
        const auto& err = unwrap_err(module);
        DOCFORGE_LOG_DEBUG("extract", source.filename() << ":" << err.span.start.line << ":"
                                                        << err.span.start.column << ": "
                                                        << err.message);
        return err;
    }
    Extractor extractor(source, [](CodeElement& element, const parser::Stmt& node) {
        augment(element, node);
    });
    return extractor.extract(unwrap(module));
}

auto detect_indent_unit(const lexer::Source& source) -> std::string {
    std::string_view previous;
    for (uint32_t n = 1; n <= source.line_count(); ++n) {
        auto line = source.line(n);
        auto stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#') {
            continue;
        }
        auto indent = line.find_first_not_of(" \t");
        if (indent > 0 && !previous.empty() && previous.back() == ':') {
            return std::string(line.substr(0, indent));
        }
        previous = stripped;
    }
    return "    ";
}

} // namespace docforge::analysis
