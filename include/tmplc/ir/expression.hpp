// Expression tree carried by template IR ops (bindings, handler statements, variable initializers)
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tmplc::ir
{

    // Identity token correlating a declaration (view, element, variable) with its references.
    using XrefId = uint32_t;

    struct Expression;
    using ExprPtr = std::unique_ptr<Expression>;

    using literal_value = std::variant<std::monostate, bool, int64_t, double, std::string>;

    struct LiteralExpr
    {
        literal_value value;
    };
    // Read of a name from the component scope (not resolved through an xref).
    struct LexicalReadExpr
    {
        std::string name;
    };
    // Read of a semantic variable. The name stays empty until the naming phase backfills it.
    struct ReadVariableExpr
    {
        XrefId xref{0};
        std::optional<std::string> name;
    };
    struct ContextExpr
    {
        XrefId view{0};
    };
    struct ReadPropExpr
    {
        ExprPtr receiver;
        std::string name;
    };
    struct CallExpr
    {
        ExprPtr fn;
        std::vector<ExprPtr> args;
    };
    struct BinaryExpr
    {
        std::string op;
        ExprPtr lhs;
        ExprPtr rhs;
    };
    struct NotExpr
    {
        ExprPtr operand;
    };
    // strings.size() == exprs.size() + 1
    struct InterpolationExpr
    {
        std::vector<std::string> strings;
        std::vector<ExprPtr> exprs;
    };

    using expression_data = std::variant<LiteralExpr, LexicalReadExpr, ReadVariableExpr, ContextExpr, ReadPropExpr,
                                         CallExpr, BinaryExpr, NotExpr, InterpolationExpr>;

    struct Expression
    {
        expression_data data;
    };

    // Visit `expr` and every nested expression, children before parents.
    void visit_expressions(Expression &expr, const std::function<void(Expression &)> &fn);

    inline ReadVariableExpr *as_read_variable(Expression &e) { return std::get_if<ReadVariableExpr>(&e.data); }

    // ------ Factory helpers ------
    inline ExprPtr make_expr(expression_data d) { return std::make_unique<Expression>(Expression{std::move(d)}); }
    inline ExprPtr lit(literal_value v) { return make_expr(LiteralExpr{std::move(v)}); }
    inline ExprPtr lit_i64(int64_t v) { return lit(literal_value{std::in_place_type<int64_t>, v}); }
    inline ExprPtr lit_str(std::string s) { return lit(literal_value{std::in_place_type<std::string>, std::move(s)}); }
    inline ExprPtr lit_bool(bool b) { return lit(literal_value{std::in_place_type<bool>, b}); }
    inline ExprPtr lexical_read(std::string name) { return make_expr(LexicalReadExpr{std::move(name)}); }
    inline ExprPtr read_variable(XrefId xref) { return make_expr(ReadVariableExpr{xref, std::nullopt}); }
    inline ExprPtr context(XrefId view) { return make_expr(ContextExpr{view}); }
    inline ExprPtr read_prop(ExprPtr receiver, std::string name) { return make_expr(ReadPropExpr{std::move(receiver), std::move(name)}); }
    inline ExprPtr binary(std::string op, ExprPtr lhs, ExprPtr rhs) { return make_expr(BinaryExpr{std::move(op), std::move(lhs), std::move(rhs)}); }
    inline ExprPtr logical_not(ExprPtr operand) { return make_expr(NotExpr{std::move(operand)}); }
    ExprPtr call(ExprPtr fn, std::vector<ExprPtr> args);
    ExprPtr interpolation(std::vector<std::string> strings, std::vector<ExprPtr> exprs);

} // namespace tmplc::ir
