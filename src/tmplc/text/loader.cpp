#include "tmplc/text/loader.hpp"
#include <cstdio>
#include <limits>
#include <map>

namespace tmplc::text {

namespace {

load_error at(const form& f, const std::string& msg){ return load_error(msg, f.line, f.col); }

bool is_atomic(const form& f){ return !as_list(f) && !as_vector(f); }

// Strings and symbols are both accepted wherever a name is expected.
std::string text_of(const form& f, const char* what){
    if(auto* s = std::get_if<std::string>(&f.data)) return *s;
    if(auto* s = as_symbol(f)) return s->name;
    throw at(f, std::string(what) + " must be a string or symbol");
}

const std::string& head_of(const form& f, const char* what){
    auto* l = as_list(f);
    if(!l || l->elems.empty() || !as_symbol(*l->elems[0])) throw at(f, std::string(what) + " must be a list headed by a symbol");
    return as_symbol(*l->elems[0])->name;
}

// Keyword arguments of a (head :k v ... positional ...) form.
struct kwargs {
    const form& owner;
    std::string head;
    std::vector<form_ptr> positional;
    std::map<std::string, form_ptr> named;

    kwargs(const form& f, const char* what): owner(f), head(head_of(f, what)){
        const auto& elems = as_list(f)->elems;
        for(size_t i = 1; i < elems.size(); ++i){
            if(auto* k = as_keyword(*elems[i])){
                if(i + 1 >= elems.size()) throw at(*elems[i], "keyword :" + k->name + " has no value");
                if(!named.emplace(k->name, elems[i + 1]).second) throw at(*elems[i], "keyword :" + k->name + " given twice");
                ++i;
            } else {
                positional.push_back(elems[i]);
            }
        }
    }

    const form* get(const std::string& k) const {
        auto it = named.find(k);
        if(it == named.end() || is_nil(*it->second)) return nullptr;
        return it->second.get();
    }
    const form& require(const std::string& k) const {
        if(auto* f = get(k)) return *f;
        throw at(owner, "(" + head + ") requires :" + k);
    }
    std::string str(const std::string& k) const { return text_of(require(k), (":" + k).c_str()); }
    std::optional<std::string> opt_str(const std::string& k) const {
        if(auto* f = get(k)) return text_of(*f, (":" + k).c_str());
        return std::nullopt;
    }
    std::string str_or(const std::string& k, std::string def) const { auto v = opt_str(k); return v ? *v : def; }
    std::optional<int64_t> opt_i64(const std::string& k) const {
        auto* f = get(k);
        if(!f) return std::nullopt;
        if(auto* v = std::get_if<int64_t>(&f->data)) return *v;
        throw at(*f, ":" + k + " must be an integer");
    }
    int64_t i64(const std::string& k) const {
        auto v = opt_i64(k);
        if(!v) throw at(owner, "(" + head + ") requires :" + k);
        return *v;
    }
    bool flag(const std::string& k) const {
        auto* f = get(k);
        if(!f) return false;
        if(auto* b = std::get_if<bool>(&f->data)) return *b;
        throw at(*f, ":" + k + " must be true or false");
    }
    const vector_t* vec(const std::string& k) const {
        auto* f = get(k);
        if(!f) return nullptr;
        auto* v = as_vector(*f);
        if(!v) throw at(*f, ":" + k + " must be a vector");
        return v;
    }
    const form& only_positional() const {
        if(positional.size() != 1) throw at(owner, "(" + head + ") takes exactly one operand");
        return *positional[0];
    }
};

// Xrefs are unsigned 32-bit; anything outside that range is rejected rather than wrapped.
ir::XrefId checked_xref(const form& f, int64_t v, const std::string& what){
    if(v < 0 || v > (int64_t)std::numeric_limits<ir::XrefId>::max())
        throw at(f, what + " " + std::to_string(v) + " is out of range");
    return (ir::XrefId)v;
}

std::optional<ir::XrefId> opt_xref(const kwargs& kw, const std::string& k){
    if(auto v = kw.opt_i64(k)) return checked_xref(kw.require(k), *v, ":" + k);
    return std::nullopt;
}

ir::XrefId xref_of(const kwargs& kw, const std::string& k, CompilationJob& job){
    auto x = checked_xref(kw.require(k), kw.i64(k), ":" + k);
    job.note_xref_id(x);
    return x;
}

ir::SlotHandle slot_of(const kwargs& kw, const std::string& k = "slot"){
    ir::SlotHandle h;
    if(auto v = kw.opt_i64(k)){
        if(*v < 0 || *v > std::numeric_limits<int32_t>::max())
            throw at(kw.require(k), ":" + k + " " + std::to_string(*v) + " is out of range");
        h.slot = (int32_t)*v;
    }
    return h;
}

ir::ExprPtr expr_arg(const kwargs& kw, const std::string& k){
    auto* f = kw.get(k);
    return f ? load_expression(*f) : nullptr;
}

ir::OpList load_ops(const vector_t* v, CompilationJob& job){
    ir::OpList out;
    if(!v) return out;
    for(auto& f : v->elems) out.push_back(load_op(*f, job));
    return out;
}

ir::SemanticVariablePtr load_variable(const kwargs& kw){
    std::string kind = kw.str_or("kind", "context");
    ir::SemanticVariablePtr var;
    if(kind == "context") var = ir::context_variable(opt_xref(kw, "view").value_or(0));
    else if(kind == "identifier") var = ir::identifier_variable(kw.str("identifier"));
    else if(kind == "saved-view") var = ir::saved_view_variable(opt_xref(kw, "view").value_or(0));
    else throw at(kw.require("kind"), "unknown variable kind '" + kind + "'");
    var->name = kw.opt_str("name");
    return var;
}

CompatibilityMode compat_of(const kwargs& kw){
    auto v = kw.opt_str("compat");
    if(!v || *v == "full") return CompatibilityMode::Full;
    if(*v == "tdb") return CompatibilityMode::TemplateDefinitionBuilder;
    throw at(kw.require("compat"), "unknown compatibility mode '" + *v + "' (expected full or tdb)");
}

void load_unit_body(const kwargs& kw, CompilationUnit& unit, CompilationJob& job){
    unit.fn_name = kw.opt_str("fn");
    unit.create = load_ops(kw.vec("create"), job);
    unit.update = load_ops(kw.vec("update"), job);
}

} // namespace

ir::ExprPtr load_expression(const form& f){
    if(is_atomic(f)){
        struct V {
            const form& f;
            ir::ExprPtr operator()(std::monostate) const { return ir::lit(std::monostate{}); }
            ir::ExprPtr operator()(bool b) const { return ir::lit_bool(b); }
            ir::ExprPtr operator()(int64_t i) const { return ir::lit_i64(i); }
            ir::ExprPtr operator()(double d) const { return ir::lit(ir::literal_value{std::in_place_type<double>, d}); }
            ir::ExprPtr operator()(const std::string& s) const { return ir::lit_str(s); }
            ir::ExprPtr operator()(const keyword& k) const { throw at(f, "unexpected keyword :" + k.name + " in expression position"); }
            ir::ExprPtr operator()(const symbol& s) const { return ir::lexical_read(s.name); }
            ir::ExprPtr operator()(const list&) const { return nullptr; }
            ir::ExprPtr operator()(const vector_t&) const { return nullptr; }
        };
        return std::visit(V{f}, f.data);
    }
    kwargs kw(f, "expression");
    const auto& h = kw.head;
    if(h == "lit") return load_expression(kw.only_positional());
    if(h == "lexical") return ir::lexical_read(text_of(kw.only_positional(), "lexical name"));
    if(h == "read-var"){
        auto* x = std::get_if<int64_t>(&kw.only_positional().data);
        if(!x) throw at(f, "(read-var) takes a variable xref");
        auto e = ir::read_variable(checked_xref(f, *x, "variable xref"));
        ir::as_read_variable(*e)->name = kw.opt_str("name");
        return e;
    }
    if(h == "ctx"){
        auto* x = std::get_if<int64_t>(&kw.only_positional().data);
        if(!x) throw at(f, "(ctx) takes a view xref");
        return ir::context(checked_xref(f, *x, "view xref"));
    }
    if(h == "prop"){
        if(kw.positional.size() != 2) throw at(f, "(prop) takes a receiver and a name");
        return ir::read_prop(load_expression(*kw.positional[0]), text_of(*kw.positional[1], "property name"));
    }
    if(h == "call"){
        if(kw.positional.empty()) throw at(f, "(call) requires a callee");
        std::vector<ir::ExprPtr> args;
        for(size_t i = 1; i < kw.positional.size(); ++i) args.push_back(load_expression(*kw.positional[i]));
        return ir::call(load_expression(*kw.positional[0]), std::move(args));
    }
    if(h == "binary"){
        if(kw.positional.size() != 3) throw at(f, "(binary) takes an operator and two operands");
        return ir::binary(text_of(*kw.positional[0], "operator"), load_expression(*kw.positional[1]), load_expression(*kw.positional[2]));
    }
    if(h == "not") return ir::logical_not(load_expression(kw.only_positional()));
    if(h == "interp"){
        if(kw.positional.size() != 2 || !as_vector(*kw.positional[0]) || !as_vector(*kw.positional[1]))
            throw at(f, "(interp) takes a vector of strings and a vector of expressions");
        std::vector<std::string> strings;
        for(auto& s : as_vector(*kw.positional[0])->elems) strings.push_back(text_of(*s, "interpolation string"));
        std::vector<ir::ExprPtr> exprs;
        for(auto& e : as_vector(*kw.positional[1])->elems) exprs.push_back(load_expression(*e));
        if(strings.size() != exprs.size() + 1) throw at(f, "(interp) needs exactly one more string than expressions");
        return ir::interpolation(std::move(strings), std::move(exprs));
    }
    throw at(f, "unknown expression '" + h + "'");
}

ir::OpPtr load_op(const form& f, CompilationJob& job){
    kwargs kw(f, "op");
    const auto& h = kw.head;
    if(h == "element-start") return ir::make_op(ir::ElementStartOp{xref_of(kw, "xref", job), kw.str("tag"), slot_of(kw)});
    if(h == "element-end") return ir::make_op(ir::ElementEndOp{xref_of(kw, "xref", job)});
    if(h == "text") return ir::make_op(ir::TextOp{xref_of(kw, "xref", job), kw.str_or("value", ""), slot_of(kw)});
    if(h == "advance"){
        auto delta = kw.opt_i64("delta").value_or(1);
        if(delta < 0 || delta > std::numeric_limits<int32_t>::max()) throw at(f, ":delta " + std::to_string(delta) + " is out of range");
        return ir::make_op(ir::AdvanceOp{(int32_t)delta});
    }
    if(h == "statement") return ir::make_op(ir::StatementOp{load_expression(kw.only_positional())});
    if(h == "property"){
        ir::PropertyOp op;
        op.target = xref_of(kw, "target", job);
        op.name = kw.str("name");
        op.expression = expr_arg(kw, "expr");
        op.is_animation_trigger = kw.flag("animation");
        return ir::make_op(std::move(op));
    }
    if(h == "host-property"){
        ir::HostPropertyOp op;
        op.name = kw.str("name");
        op.expression = expr_arg(kw, "expr");
        op.is_animation_trigger = kw.flag("animation");
        return ir::make_op(std::move(op));
    }
    if(h == "listener"){
        ir::ListenerOp op;
        op.host_listener = kw.flag("host");
        if(!op.host_listener) op.target = xref_of(kw, "target", job);
        op.target_slot = slot_of(kw);
        op.tag = kw.opt_str("tag");
        op.name = kw.str("name");
        op.is_animation_listener = kw.flag("animation");
        op.animation_phase = kw.str_or("phase", "");
        op.handler_fn_name = kw.opt_str("handler-fn");
        op.handler_ops = load_ops(kw.vec("handler"), job);
        return ir::make_op(std::move(op));
    }
    if(h == "variable"){
        ir::VariableOp op;
        op.xref = xref_of(kw, "xref", job);
        op.variable = load_variable(kw);
        op.initializer = expr_arg(kw, "init");
        return ir::make_op(std::move(op));
    }
    if(h == "template"){
        ir::TemplateOp op;
        op.xref = xref_of(kw, "xref", job);
        op.handle = slot_of(kw);
        op.tag = kw.str_or("tag", "");
        op.function_name_suffix = kw.str_or("suffix", "");
        return ir::make_op(std::move(op));
    }
    if(h == "repeater-create"){
        ir::RepeaterCreateOp op;
        op.xref = xref_of(kw, "xref", job);
        if(kw.get("empty")) op.empty_view = xref_of(kw, "empty", job);
        op.handle = slot_of(kw);
        op.tag = kw.str_or("tag", "");
        op.function_name_suffix = kw.str_or("suffix", "For");
        return ir::make_op(std::move(op));
    }
    if(h == "style-prop"){
        ir::StylePropOp op;
        op.target = xref_of(kw, "target", job);
        op.name = kw.str("name");
        op.expression = expr_arg(kw, "expr");
        op.unit = kw.opt_str("unit");
        return ir::make_op(std::move(op));
    }
    if(h == "class-prop"){
        ir::ClassPropOp op;
        op.target = xref_of(kw, "target", job);
        op.name = kw.str("name");
        op.expression = expr_arg(kw, "expr");
        return ir::make_op(std::move(op));
    }
    throw at(f, "unknown op '" + h + "'");
}

std::unique_ptr<CompilationJob> load_job(const form& root, const LoadOptions& opts){
    kwargs kw(root, "job");
    if(kw.head != "job") throw at(root, "expected (job ...), found (" + kw.head + " ...)");
    std::string name = opts.component_name ? *opts.component_name : kw.str("name");
    CompatibilityMode compat = opts.compatibility ? *opts.compatibility : compat_of(kw);
    std::string kind = kw.str_or("kind", "component");
    const bool trace = detail::env_flag_enabled("TMPLC_DEBUG_TEXT");

    if(kind == "host"){
        auto job = std::make_unique<HostBindingCompilationJob>(name, compat);
        if(kw.positional.size() != 1) throw at(root, "host job requires exactly one (host ...) unit");
        kwargs unit(*kw.positional[0], "unit");
        if(unit.head != "host") throw at(*kw.positional[0], "expected (host ...), found (" + unit.head + " ...)");
        load_unit_body(unit, job->root(), *job);
        if(trace) std::fprintf(stderr, "[dbg][text][load] host job name=%s\n", name.c_str());
        return job;
    }
    if(kind != "component") throw at(kw.require("kind"), "unknown job kind '" + kind + "' (expected component or host)");

    auto job = std::make_unique<ComponentCompilationJob>(name, compat);
    if(kw.positional.empty()) throw at(root, "component job requires a root (view ...)");
    bool first = true;
    for(auto& uf : kw.positional){
        kwargs unit(*uf, "unit");
        if(unit.head != "view") throw at(*uf, "expected (view ...), found (" + unit.head + " ...)");
        CompilationUnit* target = nullptr;
        if(first){
            auto x = unit.opt_i64("xref");
            if(x && *x != (int64_t)job->root().xref()) throw at(unit.require("xref"), "root view must have :xref " + std::to_string(job->root().xref()));
            target = &job->root();
            first = false;
        } else {
            auto x = checked_xref(unit.require("xref"), unit.i64("xref"), ":xref");
            std::optional<ir::XrefId> parent = opt_xref(unit, "parent");
            if(job->find_view(x)) throw at(*uf, "view xref " + std::to_string(x) + " declared twice");
            target = &job->add_view(x, parent);
        }
        load_unit_body(unit, *target, *job);
        if(trace) std::fprintf(stderr, "[dbg][text][load] view xref=%u create=%zu update=%zu\n", target->xref(), target->create.size(), target->update.size());
    }
    return job;
}

std::unique_ptr<CompilationJob> read_job(std::string_view src, const std::string& source_name, const LoadOptions& opts){
    auto root = parse(src, source_name);
    return load_job(*root, opts);
}

} // namespace tmplc::text
