#include "tmplc/text/printer.hpp"

namespace tmplc::text {

namespace {

// (head :k v ...) builder; optional arguments are only written when present.
struct form_builder {
    std::vector<form_ptr> elems;
    explicit form_builder(const char* head){ elems.push_back(f_sym(head)); }
    form_builder& kv(const char* k, form_ptr v){ elems.push_back(f_kw(k)); elems.push_back(std::move(v)); return *this; }
    form_builder& arg(form_ptr v){ elems.push_back(std::move(v)); return *this; }
    form_builder& str(const char* k, const std::string& v){ return kv(k, f_str(v)); }
    form_builder& opt_str(const char* k, const std::optional<std::string>& v){ if(v) kv(k, f_str(*v)); return *this; }
    form_builder& xref(const char* k, ir::XrefId x){ return kv(k, f_i64(x)); }
    form_builder& slot(const ir::SlotHandle& h){ if(h.slot) kv("slot", f_i64(*h.slot)); return *this; }
    form_builder& flag(const char* k, bool b){ if(b) kv(k, f_bool(true)); return *this; }
    form_builder& expr(const char* k, const ir::ExprPtr& e){ if(e) kv(k, expression_to_form(*e)); return *this; }
    form_ptr done(){ return f_list(std::move(elems)); }
};

form_ptr ops_to_form(const ir::OpList& ops){
    std::vector<form_ptr> out;
    for(auto& op : ops) out.push_back(op_to_form(*op));
    return f_vec(std::move(out));
}

form_ptr unit_to_form(const char* head, CompilationUnit& unit, std::optional<ir::XrefId> xref, std::optional<ir::XrefId> parent){
    form_builder b(head);
    if(xref) b.xref("xref", *xref);
    if(parent) b.xref("parent", *parent);
    b.opt_str("fn", unit.fn_name);
    if(!unit.create.empty()) b.kv("create", ops_to_form(unit.create));
    if(!unit.update.empty()) b.kv("update", ops_to_form(unit.update));
    return b.done();
}

} // namespace

form_ptr expression_to_form(const ir::Expression& e){
    struct V {
        form_ptr operator()(const ir::LiteralExpr& x) const {
            struct L {
                form_ptr operator()(std::monostate) const { return f_nil(); }
                form_ptr operator()(bool b) const { return f_bool(b); }
                form_ptr operator()(int64_t i) const { return f_i64(i); }
                form_ptr operator()(double d) const { return f_f64(d); }
                form_ptr operator()(const std::string& s) const { return f_str(s); }
            };
            return std::visit(L{}, x.value);
        }
        form_ptr operator()(const ir::LexicalReadExpr& x) const { return form_builder("lexical").arg(f_str(x.name)).done(); }
        form_ptr operator()(const ir::ReadVariableExpr& x) const { return form_builder("read-var").arg(f_i64(x.xref)).opt_str("name", x.name).done(); }
        form_ptr operator()(const ir::ContextExpr& x) const { return form_builder("ctx").arg(f_i64(x.view)).done(); }
        form_ptr operator()(const ir::ReadPropExpr& x) const { return form_builder("prop").arg(expression_to_form(*x.receiver)).arg(f_str(x.name)).done(); }
        form_ptr operator()(const ir::CallExpr& x) const {
            form_builder b("call");
            b.arg(expression_to_form(*x.fn));
            for(auto& a : x.args) b.arg(expression_to_form(*a));
            return b.done();
        }
        form_ptr operator()(const ir::BinaryExpr& x) const { return form_builder("binary").arg(f_str(x.op)).arg(expression_to_form(*x.lhs)).arg(expression_to_form(*x.rhs)).done(); }
        form_ptr operator()(const ir::NotExpr& x) const { return form_builder("not").arg(expression_to_form(*x.operand)).done(); }
        form_ptr operator()(const ir::InterpolationExpr& x) const {
            std::vector<form_ptr> strings, exprs;
            for(auto& s : x.strings) strings.push_back(f_str(s));
            for(auto& e : x.exprs) exprs.push_back(expression_to_form(*e));
            return form_builder("interp").arg(f_vec(std::move(strings))).arg(f_vec(std::move(exprs))).done();
        }
    };
    return std::visit(V{}, e.data);
}

form_ptr op_to_form(const ir::Op& op){
    struct V {
        form_ptr operator()(const ir::ElementStartOp& o) const { return form_builder("element-start").xref("xref", o.xref).str("tag", o.tag).slot(o.handle).done(); }
        form_ptr operator()(const ir::ElementEndOp& o) const { return form_builder("element-end").xref("xref", o.xref).done(); }
        form_ptr operator()(const ir::TextOp& o) const { return form_builder("text").xref("xref", o.xref).str("value", o.initial_value).slot(o.handle).done(); }
        form_ptr operator()(const ir::AdvanceOp& o) const { return form_builder("advance").kv("delta", f_i64(o.delta)).done(); }
        form_ptr operator()(const ir::StatementOp& o) const { return form_builder("statement").arg(o.expr ? expression_to_form(*o.expr) : f_nil()).done(); }
        form_ptr operator()(const ir::PropertyOp& o) const {
            return form_builder("property").xref("target", o.target).str("name", o.name).expr("expr", o.expression).flag("animation", o.is_animation_trigger).done();
        }
        form_ptr operator()(const ir::HostPropertyOp& o) const {
            return form_builder("host-property").str("name", o.name).expr("expr", o.expression).flag("animation", o.is_animation_trigger).done();
        }
        form_ptr operator()(const ir::ListenerOp& o) const {
            form_builder b("listener");
            if(o.host_listener) b.flag("host", true); else b.xref("target", o.target);
            b.opt_str("tag", o.tag).slot(o.target_slot).str("name", o.name);
            if(o.is_animation_listener) b.flag("animation", true).str("phase", o.animation_phase);
            b.opt_str("handler-fn", o.handler_fn_name);
            if(!o.handler_ops.empty()) b.kv("handler", ops_to_form(o.handler_ops));
            return b.done();
        }
        form_ptr operator()(const ir::VariableOp& o) const {
            form_builder b("variable");
            b.xref("xref", o.xref);
            if(o.variable){
                b.kv("kind", f_sym(ir::to_string(o.variable->kind)));
                if(o.variable->kind == ir::SemanticVariableKind::Identifier) b.str("identifier", o.variable->identifier);
                else b.xref("view", o.variable->view);
                b.opt_str("name", o.variable->name);
            }
            return b.expr("init", o.initializer).done();
        }
        form_ptr operator()(const ir::TemplateOp& o) const {
            form_builder b("template");
            b.xref("xref", o.xref).slot(o.handle);
            if(!o.tag.empty()) b.str("tag", o.tag);
            if(!o.function_name_suffix.empty()) b.str("suffix", o.function_name_suffix);
            return b.done();
        }
        form_ptr operator()(const ir::RepeaterCreateOp& o) const {
            form_builder b("repeater-create");
            b.xref("xref", o.xref);
            if(o.empty_view) b.xref("empty", *o.empty_view);
            b.slot(o.handle);
            if(!o.tag.empty()) b.str("tag", o.tag);
            return b.str("suffix", o.function_name_suffix).done();
        }
        form_ptr operator()(const ir::StylePropOp& o) const {
            return form_builder("style-prop").xref("target", o.target).str("name", o.name).expr("expr", o.expression).opt_str("unit", o.unit).done();
        }
        form_ptr operator()(const ir::ClassPropOp& o) const {
            return form_builder("class-prop").xref("target", o.target).str("name", o.name).expr("expr", o.expression).done();
        }
    };
    return std::visit(V{}, op.data);
}

form_ptr job_to_form(CompilationJob& job){
    form_builder b("job");
    auto* component = dynamic_cast<ComponentCompilationJob*>(&job);
    b.kv("kind", f_sym(component ? "component" : "host"));
    b.str("name", job.component_name());
    b.kv("compat", f_sym(job.compatibility() == CompatibilityMode::TemplateDefinitionBuilder ? "tdb" : "full"));
    if(component){
        for(auto& kv : component->views()){
            auto& view = *kv.second;
            b.arg(unit_to_form("view", view, view.xref(), view.parent()));
        }
    } else {
        b.arg(unit_to_form("host", job.root(), std::nullopt, std::nullopt));
    }
    return b.done();
}

std::string print_job(CompilationJob& job, bool pretty){
    auto f = job_to_form(job);
    return pretty ? to_pretty_string(*f) : to_string(*f);
}

} // namespace tmplc::text
