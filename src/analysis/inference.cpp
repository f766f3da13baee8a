//! # Type and Complexity Inference
//!
//! | Walker              | Produces                                 |
//! |---------------------|------------------------------------------|
//! | `EvidenceCollector` | evidence bit set per tracked parameter   |
//! | `ReturnCollector`   | `return` and `yield` value expressions   |
//! | `ComplexityCounter` | decision point count                     |

#include "analysis/inference.hpp"

#include "analysis/walker.hpp"
#include "log/log.hpp"

#include <array>
#include <unordered_map>
#include <unordered_set>

namespace docforge::analysis {

namespace {

// ============================================================================
// Tables
// ============================================================================

struct NamedTypeSet {
    const char* name;
    TypeSet types;
};

/// Ordered from most to least specific; resolution picks the first entry
/// that contains the candidate intersection.
constexpr std::array<NamedTypeSet, 14> PRIORITY_TABLE = {{
    {"int", types::INT},
    {"float", types::FLOAT},
    {"str", types::STR},
    {"bool", types::BOOL},
    {"list", types::LIST},
    {"tuple", types::TUPLE},
    {"dict", types::DICT},
    {"set", types::SET},
    {"Callable", types::CALLABLE},
    {"object", types::OBJECT},
    {"int | float", types::INT | types::FLOAT},
    {"Sequence", types::LIST | types::TUPLE | types::STR},
    {"Sequence | Mapping", types::LIST | types::TUPLE | types::STR | types::DICT},
    {"Iterable", types::LIST | types::TUPLE | types::STR | types::DICT | types::SET},
}};

constexpr TypeSet NUMBER = types::INT | types::FLOAT;
constexpr TypeSet SEQUENCE = types::LIST | types::TUPLE | types::STR;
constexpr TypeSet CONTAINER = SEQUENCE | types::DICT | types::SET;

const std::unordered_set<std::string_view> LIST_METHODS = {"append", "extend",  "insert",
                                                           "sort",   "reverse", "remove"};
const std::unordered_set<std::string_view> SET_METHODS = {
    "add", "discard", "union", "intersection", "difference", "issubset", "issuperset"};
const std::unordered_set<std::string_view> MAPPING_METHODS = {"keys", "items", "values", "get",
                                                              "setdefault"};
const std::unordered_set<std::string_view> STRING_METHODS = {
    "lower",      "upper",    "strip",     "lstrip",  "rstrip",   "split",   "rsplit",
    "splitlines", "startswith", "endswith", "replace", "format",   "encode",  "isdigit",
    "isalpha",    "isalnum",  "isspace",   "title",   "capitalize", "casefold", "zfill",
    "center",     "ljust",    "rjust",     "partition", "rpartition", "removeprefix",
    "removesuffix"};
const std::unordered_set<std::string_view> ITERATING_BUILTINS = {
    "sum",  "sorted", "enumerate", "zip", "list",     "tuple", "set",
    "frozenset", "any", "all",     "reversed", "iter", "min",   "max"};
const std::unordered_set<std::string_view> NUMERIC_BUILTINS = {"abs", "round", "divmod", "pow"};

auto is_string_literal(const parser::Expr& expr) -> bool {
    if (!expr.is<parser::ConstantExpr>()) {
        return false;
    }
    auto kind = expr.as<parser::ConstantExpr>().kind;
    return kind == parser::ConstantKind::Str || kind == parser::ConstantKind::FString;
}

auto is_number_literal(const parser::Expr& expr) -> bool {
    if (expr.is<parser::UnaryExpr>()) {
        const auto& unary = expr.as<parser::UnaryExpr>();
        return (unary.op == "-" || unary.op == "+") && is_number_literal(*unary.operand);
    }
    if (!expr.is<parser::ConstantExpr>()) {
        return false;
    }
    auto kind = expr.as<parser::ConstantExpr>().kind;
    return kind == parser::ConstantKind::Int || kind == parser::ConstantKind::Float;
}

auto is_int_literal(const parser::Expr& expr) -> bool {
    if (expr.is<parser::UnaryExpr>()) {
        const auto& unary = expr.as<parser::UnaryExpr>();
        return unary.op == "-" && is_int_literal(*unary.operand);
    }
    return expr.is<parser::ConstantExpr>() &&
           expr.as<parser::ConstantExpr>().kind == parser::ConstantKind::Int;
}

auto is_bitwise_op(std::string_view op) -> bool {
    return op == "&" || op == "|" || op == "^" || op == "<<" || op == ">>";
}

auto is_arithmetic_op(std::string_view op) -> bool {
    return op == "+" || op == "-" || op == "*" || op == "/" || op == "//" || op == "%" ||
           op == "**";
}

auto count_bits(TypeSet set) -> int {
    int count = 0;
    for (; set != 0; set &= static_cast<TypeSet>(set - 1)) {
        ++count;
    }
    return count;
}

// ============================================================================
// Evidence Collection
// ============================================================================

class EvidenceCollector : public ScopeWalker {
public:
    void track(const std::string& name) {
        evidence_.try_emplace(name);
    }

    [[nodiscard]] auto evidence_for(const std::string& name) const -> EvidenceSet {
        auto it = evidence_.find(name);
        return it == evidence_.end() ? EvidenceSet{} : it->second;
    }

protected:
    void on_stmt(const parser::Stmt& stmt) override {
        if (stmt.is<parser::ForStmt>()) {
            add(*stmt.as<parser::ForStmt>().iter, Evidence::Iterated);
        } else if (stmt.is<parser::AugAssignStmt>()) {
            const auto& aug = stmt.as<parser::AugAssignStmt>();
            if (aug.op == "+" && is_string_literal(*aug.value)) {
                add(*aug.target, Evidence::StringOperand);
            } else if (is_bitwise_op(aug.op)) {
                add(*aug.target, Evidence::Bitwise);
            } else if (is_arithmetic_op(aug.op) && !aug.value->is<parser::CollectionExpr>()) {
                add(*aug.target, Evidence::Arithmetic);
            }
        }
    }

    void on_comprehension(const parser::Comprehension& clause) override {
        add(*clause.iter, Evidence::Iterated);
    }

    void on_expr(const parser::Expr& expr) override {
        std::visit(
            [&](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                using namespace parser;

                if constexpr (std::is_same_v<T, BinaryExpr>) {
                    on_binary(e);
                } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                    if (e.op == "-" || e.op == "+") {
                        add(*e.operand, Evidence::Arithmetic);
                    } else if (e.op == "~") {
                        add(*e.operand, Evidence::Bitwise);
                    }
                } else if constexpr (std::is_same_v<T, CompareExpr>) {
                    on_compare(e);
                } else if constexpr (std::is_same_v<T, SubscriptExpr>) {
                    on_subscript(e);
                } else if constexpr (std::is_same_v<T, CallExpr>) {
                    on_call(e);
                } else if constexpr (std::is_same_v<T, AttributeExpr>) {
                    if (handled_.count(&expr) == 0) {
                        add(*e.value, Evidence::AttributeAccess);
                    }
                }
            },
            expr.kind);
    }

private:
    std::unordered_map<std::string, EvidenceSet> evidence_;
    std::unordered_set<const parser::Expr*> handled_; ///< Method-call attributes.

    void add(const parser::Expr& expr, Evidence tag) {
        if (!expr.is<parser::NameExpr>()) {
            return;
        }
        auto it = evidence_.find(expr.as<parser::NameExpr>().name);
        if (it != evidence_.end()) {
            it->second.set(static_cast<size_t>(tag));
        }
    }

    void on_binary(const parser::BinaryExpr& bin) {
        auto classify = [&](const parser::Expr& operand, const parser::Expr& other) {
            if (is_bitwise_op(bin.op)) {
                add(operand, Evidence::Bitwise);
            } else if ((bin.op == "+" || bin.op == "%") && is_string_literal(other)) {
                add(operand, Evidence::StringOperand);
            } else if (is_arithmetic_op(bin.op)) {
                add(operand, Evidence::Arithmetic);
            }
        };
        classify(*bin.left, *bin.right);
        classify(*bin.right, *bin.left);
    }

    void on_compare(const parser::CompareExpr& cmp) {
        const parser::Expr* left = cmp.left.get();
        for (size_t i = 0; i < cmp.ops.size(); ++i) {
            const parser::Expr* right = cmp.comparators[i].get();
            const auto& op = cmp.ops[i];
            if (op == "in" || op == "not in") {
                add(*right, Evidence::Membership);
            } else if (op != "is" && op != "is not") {
                if (is_number_literal(*right)) {
                    add(*left, Evidence::Arithmetic);
                } else if (is_string_literal(*right)) {
                    add(*left, Evidence::StringOperand);
                }
                if (is_number_literal(*left)) {
                    add(*right, Evidence::Arithmetic);
                } else if (is_string_literal(*left)) {
                    add(*right, Evidence::StringOperand);
                }
            }
            left = right;
        }
    }

    void on_subscript(const parser::SubscriptExpr& sub) {
        const auto& index = *sub.index;
        if (index.is<parser::SliceExpr>() || is_int_literal(index)) {
            add(*sub.value, Evidence::Indexed);
        } else if (index.is<parser::BinaryExpr>() &&
                   is_arithmetic_op(index.as<parser::BinaryExpr>().op)) {
            add(*sub.value, Evidence::Indexed);
        } else if (is_string_literal(index)) {
            add(*sub.value, Evidence::KeyAccess);
        } else if (index.is<parser::NameExpr>() || index.is<parser::AttributeExpr>() ||
                   index.is<parser::CallExpr>()) {
            add(*sub.value, Evidence::Subscripted);
        }
    }

    void on_call(const parser::CallExpr& call) {
        const auto& func = *call.func;
        if (func.is<parser::NameExpr>()) {
            add(func, Evidence::Called);
            const auto& name = func.as<parser::NameExpr>().name;
            auto positional = [&](auto&& fn) {
                for (const auto& arg : call.args) {
                    if (!arg.keyword && arg.star == 0) {
                        fn(*arg.value);
                    }
                }
            };
            if (name == "len") {
                positional([&](const parser::Expr& arg) { add(arg, Evidence::Sized); });
            } else if (name == "range") {
                positional([&](const parser::Expr& arg) { add(arg, Evidence::RangeArgument); });
            } else if (NUMERIC_BUILTINS.count(name) != 0) {
                positional([&](const parser::Expr& arg) { add(arg, Evidence::NumericBuiltin); });
            } else if ((name == "min" || name == "max") && call.args.size() > 1) {
                // min(a, b) compares its arguments instead of iterating one.
            } else if (ITERATING_BUILTINS.count(name) != 0) {
                positional([&](const parser::Expr& arg) { add(arg, Evidence::Iterated); });
            } else if ((name == "map" || name == "filter") && call.args.size() > 1) {
                for (size_t i = 1; i < call.args.size(); ++i) {
                    add(*call.args[i].value, Evidence::Iterated);
                }
            }
            return;
        }

        if (!func.is<parser::AttributeExpr>()) {
            return;
        }
        const auto& attr = func.as<parser::AttributeExpr>();
        const auto& receiver = *attr.value;

        if (receiver.is<parser::NameExpr>() && receiver.as<parser::NameExpr>().name == "math") {
            for (const auto& arg : call.args) {
                add(*arg.value, Evidence::NumericBuiltin);
            }
            return;
        }
        if (is_string_literal(receiver) && attr.attr == "join" && !call.args.empty()) {
            add(*call.args[0].value, Evidence::Iterated);
            return;
        }
        if (!receiver.is<parser::NameExpr>() ||
            evidence_.count(receiver.as<parser::NameExpr>().name) == 0) {
            return;
        }

        handled_.insert(call.func.get());
        std::string_view method = attr.attr;
        if (LIST_METHODS.count(method) != 0) {
            add(receiver, Evidence::ListMethod);
        } else if (SET_METHODS.count(method) != 0) {
            add(receiver, Evidence::SetMethod);
        } else if (MAPPING_METHODS.count(method) != 0) {
            add(receiver, Evidence::KeyAccess);
        } else if (STRING_METHODS.count(method) != 0) {
            add(receiver, Evidence::StringOperand);
        } else {
            add(receiver, Evidence::AttributeAccess);
        }
    }
};

auto default_evidence(const parser::Expr& value) -> std::optional<Evidence> {
    if (value.is<parser::ConstantExpr>()) {
        switch (value.as<parser::ConstantExpr>().kind) {
        case parser::ConstantKind::Int:
            return Evidence::DefaultInt;
        case parser::ConstantKind::Float:
            return Evidence::DefaultFloat;
        case parser::ConstantKind::Str:
        case parser::ConstantKind::FString:
            return Evidence::DefaultStr;
        case parser::ConstantKind::True:
        case parser::ConstantKind::False:
            return Evidence::DefaultBool;
        default:
            return std::nullopt;
        }
    }
    if (value.is<parser::UnaryExpr>() && is_number_literal(value)) {
        return is_int_literal(value) ? Evidence::DefaultInt : Evidence::DefaultFloat;
    }
    if (value.is<parser::CollectionExpr>()) {
        switch (value.as<parser::CollectionExpr>().kind) {
        case parser::CollectionKind::List:
            return Evidence::DefaultList;
        case parser::CollectionKind::Tuple:
            return Evidence::DefaultTuple;
        case parser::CollectionKind::Set:
            return Evidence::DefaultSet;
        }
    }
    if (value.is<parser::DictExpr>()) {
        return Evidence::DefaultDict;
    }
    return std::nullopt;
}

// ============================================================================
// Return Inference
// ============================================================================

class ReturnCollector : public ScopeWalker {
public:
    std::vector<const parser::Expr*> returns; ///< Null for `return` / `return None`.
    std::vector<const parser::Expr*> yields;  ///< Null for a bare `yield`.
    bool delegates = false;                   ///< Saw `yield from`.

protected:
    void on_stmt(const parser::Stmt& stmt) override {
        if (stmt.is<parser::ReturnStmt>()) {
            const auto& value = stmt.as<parser::ReturnStmt>().value;
            bool none = !value || (value->is<parser::ConstantExpr>() &&
                                   value->as<parser::ConstantExpr>().kind ==
                                       parser::ConstantKind::None);
            returns.push_back(none ? nullptr : value.get());
        }
    }

    void on_expr(const parser::Expr& expr) override {
        if (expr.is<parser::YieldExpr>()) {
            const auto& yield = expr.as<parser::YieldExpr>();
            if (yield.is_from) {
                delegates = true;
            } else {
                yields.push_back(yield.value.get());
            }
        }
    }
};

/// Type set of an expression, 0 when it cannot be determined.
class ExpressionTyper {
public:
    explicit ExpressionTyper(const std::unordered_map<std::string, TypeSet>& locals)
        : locals_(locals) {}

    [[nodiscard]] auto type_of(const parser::Expr& expr) const -> TypeSet {
        return std::visit(
            [&](const auto& e) -> TypeSet {
                using T = std::decay_t<decltype(e)>;
                using namespace parser;

                if constexpr (std::is_same_v<T, ConstantExpr>) {
                    return constant_type(e.kind);
                } else if constexpr (std::is_same_v<T, CollectionExpr>) {
                    switch (e.kind) {
                    case CollectionKind::Tuple:
                        return types::TUPLE;
                    case CollectionKind::List:
                        return types::LIST;
                    case CollectionKind::Set:
                        return types::SET;
                    }
                    return 0;
                } else if constexpr (std::is_same_v<T, DictExpr>) {
                    return types::DICT;
                } else if constexpr (std::is_same_v<T, ComprehensionExpr>) {
                    switch (e.kind) {
                    case ComprehensionKind::List:
                        return types::LIST;
                    case ComprehensionKind::Set:
                        return types::SET;
                    case ComprehensionKind::Dict:
                        return types::DICT;
                    case ComprehensionKind::Generator:
                        return 0;
                    }
                    return 0;
                } else if constexpr (std::is_same_v<T, CompareExpr>) {
                    return types::BOOL;
                } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                    if (e.op == "not") {
                        return types::BOOL;
                    }
                    if (e.op == "~") {
                        return types::INT;
                    }
                    auto operand = type_of(*e.operand);
                    return (operand & ~NUMBER) == 0 && operand != 0 ? operand : NUMBER;
                } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                    return binary_type(e);
                } else if constexpr (std::is_same_v<T, IfExpr>) {
                    auto body = type_of(*e.body);
                    auto orelse = type_of(*e.orelse);
                    return (body == 0 || orelse == 0) ? 0 : static_cast<TypeSet>(body | orelse);
                } else if constexpr (std::is_same_v<T, NameExpr>) {
                    auto it = locals_.find(e.name);
                    return it == locals_.end() ? 0 : it->second;
                } else if constexpr (std::is_same_v<T, CallExpr>) {
                    return call_type(e);
                } else if constexpr (std::is_same_v<T, LambdaExpr>) {
                    return types::CALLABLE;
                } else {
                    return 0;
                }
            },
            expr.kind);
    }

private:
    const std::unordered_map<std::string, TypeSet>& locals_;

    static auto constant_type(parser::ConstantKind kind) -> TypeSet {
        switch (kind) {
        case parser::ConstantKind::Int:
            return types::INT;
        case parser::ConstantKind::Float:
            return types::FLOAT;
        case parser::ConstantKind::Str:
        case parser::ConstantKind::FString:
            return types::STR;
        case parser::ConstantKind::True:
        case parser::ConstantKind::False:
            return types::BOOL;
        default:
            return 0;
        }
    }

    [[nodiscard]] auto binary_type(const parser::BinaryExpr& bin) const -> TypeSet {
        auto left = type_of(*bin.left);
        auto right = type_of(*bin.right);
        if (is_bitwise_op(bin.op)) {
            return (left == types::INT || right == types::INT) ? types::INT : 0;
        }
        if (!is_arithmetic_op(bin.op)) {
            return 0;
        }
        if ((bin.op == "+" || bin.op == "%") && (left == types::STR || right == types::STR)) {
            return types::STR;
        }
        if (bin.op == "+" && left == right && (left == types::LIST || left == types::TUPLE)) {
            return left;
        }
        auto numeric = [](TypeSet set) { return set != 0 && (set & ~NUMBER) == 0; };
        if (bin.op == "/") {
            return (numeric(left) || numeric(right)) ? types::FLOAT : 0;
        }
        if (left == types::INT && right == types::INT) {
            return types::INT;
        }
        if ((left == types::FLOAT && numeric(right)) || (right == types::FLOAT && numeric(left))) {
            return types::FLOAT;
        }
        if (numeric(left) || numeric(right)) {
            return NUMBER;
        }
        return 0;
    }

    [[nodiscard]] auto call_type(const parser::CallExpr& call) const -> TypeSet {
        const auto& func = *call.func;
        if (func.is<parser::NameExpr>()) {
            const auto& name = func.as<parser::NameExpr>().name;
            if (name == "len" || name == "int" || name == "ord" || name == "hash") {
                return types::INT;
            }
            if (name == "float") {
                return types::FLOAT;
            }
            if (name == "str" || name == "repr" || name == "chr" || name == "format") {
                return types::STR;
            }
            if (name == "bool" || name == "isinstance" || name == "callable" || name == "any" ||
                name == "all") {
                return types::BOOL;
            }
            if (name == "list" || name == "sorted") {
                return types::LIST;
            }
            if (name == "tuple") {
                return types::TUPLE;
            }
            if (name == "dict") {
                return types::DICT;
            }
            if (name == "set") {
                return types::SET;
            }
            if (name == "abs" || name == "round" || name == "sum") {
                return NUMBER;
            }
            return 0;
        }
        if (func.is<parser::AttributeExpr>()) {
            const auto& attr = func.as<parser::AttributeExpr>();
            if (is_string_literal(*attr.value) &&
                (attr.attr == "join" || attr.attr == "format")) {
                return types::STR;
            }
            if (type_of(*attr.value) == types::STR && STRING_METHODS.count(attr.attr) != 0) {
                return attr.attr == "split" || attr.attr == "rsplit" || attr.attr == "splitlines"
                           ? types::LIST
                           : (attr.attr.rfind("is", 0) == 0 || attr.attr == "startswith" ||
                              attr.attr == "endswith")
                                 ? types::BOOL
                                 : types::STR;
            }
        }
        return 0;
    }
};

/// Union of the value types; `has_unknown` when any value is untyped.
struct ValueUnion {
    TypeSet types = 0;
    bool has_none = false;
    bool has_unknown = false;
};

auto unite(const std::vector<const parser::Expr*>& values, const ExpressionTyper& typer)
    -> ValueUnion {
    ValueUnion result;
    for (const auto* value : values) {
        if (!value) {
            result.has_none = true;
            continue;
        }
        auto set = typer.type_of(*value);
        if (set == 0) {
            result.has_unknown = true;
        } else {
            result.types |= set;
        }
    }
    return result;
}

// ============================================================================
// Complexity
// ============================================================================

class ComplexityCounter : public ScopeWalker {
public:
    int decisions = 0;

protected:
    void on_stmt(const parser::Stmt& stmt) override {
        if (stmt.is<parser::IfStmt>() || stmt.is<parser::ForStmt>() ||
            stmt.is<parser::WhileStmt>()) {
            ++decisions;
        } else if (stmt.is<parser::MatchStmt>()) {
            decisions += static_cast<int>(stmt.as<parser::MatchStmt>().cases.size());
        }
    }

    void on_handler(const parser::ExceptHandler& /*handler*/) override {
        ++decisions;
    }

    void on_comprehension(const parser::Comprehension& clause) override {
        decisions += 1 + static_cast<int>(clause.ifs.size());
    }

    void on_expr(const parser::Expr& expr) override {
        if (expr.is<parser::BoolOpExpr>()) {
            decisions += static_cast<int>(expr.as<parser::BoolOpExpr>().values.size()) - 1;
        } else if (expr.is<parser::IfExpr>()) {
            ++decisions;
        }
    }
};

/// "arithmetic, sized" for logging.
auto describe_evidence(const EvidenceSet& evidence) -> std::string {
    if (evidence.none()) {
        return "no evidence";
    }
    std::string text;
    for (size_t i = 0; i < EVIDENCE_COUNT; ++i) {
        if (!evidence.test(i)) {
            continue;
        }
        if (!text.empty()) {
            text += ", ";
        }
        text += evidence_to_string(static_cast<Evidence>(i));
    }
    return text;
}

void infer_parameters(CodeElement& element, const parser::FunctionDef& func) {
    EvidenceCollector collector;
    for (const auto& param : element.parameters) {
        if (!param.declared_type) {
            collector.track(param.name);
        }
    }
    collector.walk_suite(func.body);

    for (auto& param : element.parameters) {
        if (param.declared_type) {
            continue;
        }
        if (param.kind == ParamKind::VarPositional) {
            param.inferred_type = "tuple";
            continue;
        }
        if (param.kind == ParamKind::VarKeyword) {
            param.inferred_type = "dict";
            continue;
        }

        auto evidence = collector.evidence_for(param.name);
        for (const auto& ast_param : func.params) {
            if (ast_param.name == param.name && ast_param.default_value) {
                if (auto tag = default_evidence(*ast_param.default_value)) {
                    evidence.set(static_cast<size_t>(*tag));
                }
            }
        }

        auto resolved = resolve(evidence);
        DOCFORGE_LOG_TRACE("infer", element.qualified_name
                                        << "(" << param.name << "): "
                                        << resolved.value_or(std::string(UNKNOWN_TYPE)) << " from "
                                        << describe_evidence(evidence));
        if (resolved) {
            param.inferred_type = *resolved;
        } else {
            param.inferred_type = UNKNOWN_TYPE;
            element.warnings.push_back(
                "ambiguous type for parameter '" + param.name + "': " +
                (evidence.none() ? "no usage evidence" : "conflicting usage evidence"));
        }
    }
}

void infer_returns(CodeElement& element, const parser::FunctionDef& func) {
    if (!element.returns || element.returns->declared_type) {
        return;
    }

    std::unordered_map<std::string, TypeSet> locals;
    for (const auto& param : element.parameters) {
        if (auto type = param.display_type()) {
            if (auto set = annotation_types(*type); set != 0) {
                locals.emplace(param.name, set);
            }
        }
    }
    ExpressionTyper typer(locals);
    ReturnCollector collector;
    collector.walk_suite(func.body);

    auto& returns = *element.returns;
    if (returns.is_generator) {
        auto yielded = unite(collector.yields, typer);
        if (!collector.delegates && !yielded.has_unknown && !yielded.has_none &&
            yielded.types != 0) {
            returns.inferred_type = "Iterator[" + render_types(yielded.types) + "]";
        } else {
            returns.inferred_type = "Generator";
        }
        return;
    }

    auto returned = unite(collector.returns, typer);
    if (returned.has_unknown || returned.types == 0) {
        returns.inferred_type = UNKNOWN_TYPE;
        element.warnings.push_back("ambiguous return type: cannot infer the type of every "
                                   "returned value");
        return;
    }

    auto rendered = render_types(returned.types);
    if (returned.has_none) {
        rendered = count_bits(returned.types) == 1 ? "Optional[" + rendered + "]"
                                                   : rendered + " | None";
    }
    returns.inferred_type = rendered;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

auto evidence_to_string(Evidence evidence) -> std::string_view {
    switch (evidence) {
    case Evidence::Arithmetic:
        return "arithmetic";
    case Evidence::Bitwise:
        return "bitwise";
    case Evidence::StringOperand:
        return "string_operand";
    case Evidence::Indexed:
        return "indexed";
    case Evidence::KeyAccess:
        return "key_access";
    case Evidence::Subscripted:
        return "subscripted";
    case Evidence::Iterated:
        return "iterated";
    case Evidence::Membership:
        return "membership";
    case Evidence::Sized:
        return "sized";
    case Evidence::ListMethod:
        return "list_method";
    case Evidence::SetMethod:
        return "set_method";
    case Evidence::Called:
        return "called";
    case Evidence::AttributeAccess:
        return "attribute_access";
    case Evidence::NumericBuiltin:
        return "numeric_builtin";
    case Evidence::RangeArgument:
        return "range_argument";
    case Evidence::DefaultInt:
        return "default_int";
    case Evidence::DefaultFloat:
        return "default_float";
    case Evidence::DefaultStr:
        return "default_str";
    case Evidence::DefaultBool:
        return "default_bool";
    case Evidence::DefaultList:
        return "default_list";
    case Evidence::DefaultTuple:
        return "default_tuple";
    case Evidence::DefaultDict:
        return "default_dict";
    case Evidence::DefaultSet:
        return "default_set";
    case Evidence::Count:
        break;
    }
    return "unknown";
}

auto candidates(Evidence evidence) -> TypeSet {
    switch (evidence) {
    case Evidence::Arithmetic:
    case Evidence::NumericBuiltin:
        return NUMBER;
    case Evidence::Bitwise:
    case Evidence::RangeArgument:
    case Evidence::DefaultInt:
        return types::INT;
    case Evidence::StringOperand:
    case Evidence::DefaultStr:
        return types::STR;
    case Evidence::Indexed:
        return SEQUENCE;
    case Evidence::KeyAccess:
    case Evidence::DefaultDict:
        return types::DICT;
    case Evidence::Subscripted:
        return SEQUENCE | types::DICT;
    case Evidence::Iterated:
    case Evidence::Membership:
    case Evidence::Sized:
        return CONTAINER;
    case Evidence::ListMethod:
    case Evidence::DefaultList:
        return types::LIST;
    case Evidence::SetMethod:
    case Evidence::DefaultSet:
        return types::SET;
    case Evidence::Called:
        return types::CALLABLE;
    case Evidence::AttributeAccess:
        return types::OBJECT;
    case Evidence::DefaultFloat:
        return types::FLOAT;
    case Evidence::DefaultBool:
        return types::BOOL;
    case Evidence::DefaultTuple:
        return types::TUPLE;
    case Evidence::Count:
        break;
    }
    return 0;
}

auto resolve(const EvidenceSet& evidence) -> std::optional<std::string> {
    auto strong = evidence;
    strong.reset(static_cast<size_t>(Evidence::AttributeAccess));
    if (strong.none()) {
        if (evidence.test(static_cast<size_t>(Evidence::AttributeAccess))) {
            return "object";
        }
        return std::nullopt;
    }

    TypeSet mask = types::ALL;
    for (size_t i = 0; i < EVIDENCE_COUNT; ++i) {
        if (strong.test(i)) {
            mask &= candidates(static_cast<Evidence>(i));
        }
    }
    if (mask == 0) {
        return std::nullopt;
    }
    for (const auto& entry : PRIORITY_TABLE) {
        if ((entry.types & mask) == mask) {
            return entry.name;
        }
    }
    return std::nullopt;
}

auto render_types(TypeSet set) -> std::string {
    for (const auto& entry : PRIORITY_TABLE) {
        if (entry.types == set) {
            return entry.name;
        }
    }
    std::string result;
    for (const auto& entry : PRIORITY_TABLE) {
        if (count_bits(entry.types) == 1 && (entry.types & set) != 0) {
            if (!result.empty()) {
                result += " | ";
            }
            result += entry.name;
        }
    }
    return result;
}

auto annotation_types(std::string_view annotation) -> TypeSet {
    auto base = annotation.substr(0, annotation.find('['));
    while (!base.empty() && base.back() == ' ') {
        base.remove_suffix(1);
    }
    if (base == "int")
        return types::INT;
    if (base == "float")
        return types::FLOAT;
    if (base == "str")
        return types::STR;
    if (base == "bool")
        return types::BOOL;
    if (base == "list" || base == "List")
        return types::LIST;
    if (base == "tuple" || base == "Tuple")
        return types::TUPLE;
    if (base == "dict" || base == "Dict")
        return types::DICT;
    if (base == "set" || base == "Set")
        return types::SET;
    if (annotation == "int | float")
        return NUMBER;
    return 0;
}

auto collect_evidence(const parser::FunctionDef& func, std::string_view name) -> EvidenceSet {
    EvidenceCollector collector;
    collector.track(std::string(name));
    collector.walk_suite(func.body);
    return collector.evidence_for(std::string(name));
}

auto compute_complexity(const parser::Suite& body) -> int {
    ComplexityCounter counter;
    counter.walk_suite(body);
    return 1 + counter.decisions;
}

void augment(CodeElement& element, const parser::Stmt& node) {
    if (node.is<parser::FunctionDef>()) {
        const auto& func = node.as<parser::FunctionDef>();
        infer_parameters(element, func);
        infer_returns(element, func);
        element.complexity_score = compute_complexity(func.body);
    } else if (node.is<parser::ClassDef>()) {
        element.complexity_score = compute_complexity(node.as<parser::ClassDef>().body);
    }
    for (const auto& warning : element.warnings) {
        DOCFORGE_LOG_DEBUG("infer", element.qualified_name << ": " << warning);
    }
}

} // namespace docforge::analysis
