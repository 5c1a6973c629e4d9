#include "tmplc/ir/expression.hpp"
#include <stdexcept>

namespace tmplc::ir {

void visit_expressions(Expression& expr, const std::function<void(Expression&)>& fn){
    struct Children {
        const std::function<void(Expression&)>& fn;
        void operator()(LiteralExpr&) const {}
        void operator()(LexicalReadExpr&) const {}
        void operator()(ReadVariableExpr&) const {}
        void operator()(ContextExpr&) const {}
        void operator()(ReadPropExpr& e) const { if(e.receiver) visit_expressions(*e.receiver, fn); }
        void operator()(CallExpr& e) const {
            if(e.fn) visit_expressions(*e.fn, fn);
            for(auto& a : e.args) if(a) visit_expressions(*a, fn);
        }
        void operator()(BinaryExpr& e) const {
            if(e.lhs) visit_expressions(*e.lhs, fn);
            if(e.rhs) visit_expressions(*e.rhs, fn);
        }
        void operator()(NotExpr& e) const { if(e.operand) visit_expressions(*e.operand, fn); }
        void operator()(InterpolationExpr& e) const { for(auto& x : e.exprs) if(x) visit_expressions(*x, fn); }
    };
    std::visit(Children{fn}, expr.data);
    fn(expr);
}

ExprPtr call(ExprPtr fn, std::vector<ExprPtr> args){
    CallExpr c; c.fn = std::move(fn); c.args = std::move(args);
    return make_expr(std::move(c));
}

ExprPtr interpolation(std::vector<std::string> strings, std::vector<ExprPtr> exprs){
    if(strings.size() != exprs.size() + 1)
        throw std::invalid_argument("interpolation: expected one more string than expressions");
    InterpolationExpr i; i.strings = std::move(strings); i.exprs = std::move(exprs);
    return make_expr(std::move(i));
}

} // namespace tmplc::ir
