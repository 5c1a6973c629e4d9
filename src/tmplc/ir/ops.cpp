#include "tmplc/ir/ops.hpp"

namespace tmplc::ir {

const char* to_string(OpKind k){
    switch(k){
        case OpKind::ElementStart: return "element-start";
        case OpKind::ElementEnd: return "element-end";
        case OpKind::Text: return "text";
        case OpKind::Advance: return "advance";
        case OpKind::Statement: return "statement";
        case OpKind::Property: return "property";
        case OpKind::HostProperty: return "host-property";
        case OpKind::Listener: return "listener";
        case OpKind::Variable: return "variable";
        case OpKind::Template: return "template";
        case OpKind::RepeaterCreate: return "repeater-create";
        case OpKind::StyleProp: return "style-prop";
        case OpKind::ClassProp: return "class-prop";
    }
    return "<unknown>";
}

const char* to_string(SemanticVariableKind k){
    switch(k){
        case SemanticVariableKind::Context: return "context";
        case SemanticVariableKind::Identifier: return "identifier";
        case SemanticVariableKind::SavedView: return "saved-view";
    }
    return "<unknown>";
}

namespace {
void visit_opt(ExprPtr& e, const std::function<void(Expression&)>& fn){ if(e) visit_expressions(*e, fn); }
}

void visit_expressions_in_op(Op& op, const std::function<void(Expression&)>& fn){
    struct V {
        const std::function<void(Expression&)>& fn;
        void operator()(ElementStartOp&) const {}
        void operator()(ElementEndOp&) const {}
        void operator()(TextOp&) const {}
        void operator()(AdvanceOp&) const {}
        void operator()(StatementOp& o) const { visit_opt(o.expr, fn); }
        void operator()(PropertyOp& o) const { visit_opt(o.expression, fn); }
        void operator()(HostPropertyOp& o) const { visit_opt(o.expression, fn); }
        // Handler ops are separate ops; CompilationUnit::for_each_op yields them.
        void operator()(ListenerOp&) const {}
        void operator()(VariableOp& o) const { visit_opt(o.initializer, fn); }
        void operator()(TemplateOp&) const {}
        void operator()(RepeaterCreateOp&) const {}
        void operator()(StylePropOp& o) const { visit_opt(o.expression, fn); }
        void operator()(ClassPropOp& o) const { visit_opt(o.expression, fn); }
    };
    std::visit(V{fn}, op.data);
}

} // namespace tmplc::ir
