#include "tmplc/phases/naming.hpp"
#include "tmplc/style.hpp"
#include <cstdio>
#include <stdexcept>

namespace tmplc::phases {

namespace {

bool trace_naming(){ return detail::env_flag_enabled("TMPLC_DEBUG_NAMING"); }

// DOM tags may be hyphenated ("my-el"); generated names use '_' instead.
std::string tag_for_fn_name(std::string tag){
    for(auto& c : tag) if(c == '-') c = '_';
    return tag;
}

void require_component_view(const CompilationUnit& unit, const char* what){
    if(unit.kind() != UnitKind::View)
        throw naming_error(NamingErrorKind::WrongUnitKind,
                           std::string("AssertionError: must be compiling a component to name a ") + what, unit.xref());
}

int32_t require_slot(const ir::SlotHandle& h, const CompilationUnit& unit, const std::string& what){
    if(!h.slot) throw naming_error(NamingErrorKind::SlotUnassigned, "expected a slot to be assigned to " + what, unit.xref());
    return *h.slot;
}

CompilationUnit& child_view(CompilationUnit& unit, ir::XrefId xref){
    auto* v = unit.job().find_view(xref);
    if(!v) throw naming_error(NamingErrorKind::UnknownView, "no view registered for xref " + std::to_string(xref), unit.xref());
    return *v;
}

// Phase 1 of a unit: assign names to everything the unit declares and descend into child views.
struct UnitNamer {
    CompilationUnit& unit;
    const std::string& base_name;
    NamingState& state;
    bool compatibility;
    VariableNameTable& var_names;

    void operator()(ir::ElementStartOp&) const {}
    void operator()(ir::ElementEndOp&) const {}
    void operator()(ir::TextOp&) const {}
    void operator()(ir::AdvanceOp&) const {}
    void operator()(ir::StatementOp&) const {}

    void operator()(ir::PropertyOp& op) const {
        if(op.is_animation_trigger && op.name.rfind('@', 0) != 0) op.name = "@" + op.name;
    }
    void operator()(ir::HostPropertyOp& op) const {
        if(op.is_animation_trigger && op.name.rfind('@', 0) != 0) op.name = "@" + op.name;
    }

    void operator()(ir::ListenerOp& op) const {
        if(op.handler_fn_name) return;
        if(!op.host_listener && !op.target_slot.slot)
            throw naming_error(NamingErrorKind::SlotUnassigned, "expected a slot to be assigned to listener '" + op.name + "'", unit.xref());
        std::string animation;
        if(op.is_animation_listener){
            op.name = "@" + op.name + "." + op.animation_phase;
            animation = "animation";
        }
        std::string fn;
        if(op.host_listener){
            fn = base_name + "_" + animation + op.name + "_HostBindingHandler";
        } else {
            if(!op.tag)
                throw naming_error(NamingErrorKind::MissingTag, "listener '" + op.name + "' has no element tag", unit.xref());
            fn = *unit.fn_name + "_" + tag_for_fn_name(*op.tag) + "_" + animation + op.name + "_" +
                 std::to_string(*op.target_slot.slot) + "_listener";
        }
        op.handler_fn_name = sanitize_identifier(fn);
        if(trace_naming()) std::fprintf(stderr, "[dbg][naming][listener] unit=%u handler=%s\n", unit.xref(), op.handler_fn_name->c_str());
    }

    void operator()(ir::VariableOp& op) const {
        if(!op.variable) throw std::logic_error("variable op " + std::to_string(op.xref) + " carries no semantic variable");
        var_names[op.xref] = get_variable_name(*op.variable, state);
        if(trace_naming()) std::fprintf(stderr, "[dbg][naming][variable] unit=%u xref=%u name=%s\n", unit.xref(), op.xref, op.variable->name->c_str());
    }

    void operator()(ir::TemplateOp& op) const {
        require_component_view(unit, "template");
        auto& child = child_view(unit, op.xref);
        int32_t slot = require_slot(op.handle, unit, "template " + std::to_string(op.xref));
        std::string suffix = op.function_name_suffix.empty() ? std::string() : "_" + op.function_name_suffix;
        name_view(child, base_name + suffix + "_" + std::to_string(slot), state, compatibility);
    }

    // Slot s holds the repeater metadata, s+1 the primary view, s+2 the empty view.
    void operator()(ir::RepeaterCreateOp& op) const {
        require_component_view(unit, "repeater");
        int64_t slot = require_slot(op.handle, unit, "repeater " + std::to_string(op.xref));
        if(op.empty_view){
            auto& empty = child_view(unit, *op.empty_view);
            name_view(empty, base_name + "_" + op.function_name_suffix + "Empty_" + std::to_string(slot + 2), state, compatibility);
        }
        auto& primary = child_view(unit, op.xref);
        name_view(primary, base_name + "_" + op.function_name_suffix + "_" + std::to_string(slot + 1), state, compatibility);
    }

    void operator()(ir::StylePropOp& op) const {
        op.name = normalize_style_prop_name(op.name);
        if(compatibility) op.name = strip_important(op.name);
    }
    void operator()(ir::ClassPropOp& op) const {
        if(compatibility) op.name = strip_important(op.name);
    }
};

} // namespace

void phase_naming(CompilationJob& job){
    NamingState state;
    name_view(job.root(), job.component_name(), state, job.compatibility() == CompatibilityMode::TemplateDefinitionBuilder);
}

void name_view(CompilationUnit& unit, const std::string& base_name, NamingState& state, bool compatibility){
    if(!state.entered.insert(unit.xref()).second)
        throw naming_error(NamingErrorKind::ViewReentered, "view " + std::to_string(unit.xref()) + " is reached more than once", unit.xref());
    if(!unit.fn_name) unit.fn_name = sanitize_identifier(base_name + "_" + unit.job().fn_suffix());
    if(trace_naming()) std::fprintf(stderr, "[dbg][naming][unit] xref=%u base=%s fn=%s\n", unit.xref(), base_name.c_str(), unit.fn_name->c_str());

    VariableNameTable var_names;
    UnitNamer namer{unit, base_name, state, compatibility, var_names};
    unit.for_each_op([&](ir::Op& op){ std::visit(namer, op.data); });

    // Every variable of this unit is named now, including ones declared after their first read.
    backfill_variable_names(unit, var_names);
}

const std::string& get_variable_name(ir::SemanticVariable& variable, NamingState& state){
    if(!variable.name){
        switch(variable.kind){
            case ir::SemanticVariableKind::Context:
                variable.name = "ctx_r" + std::to_string(state.index++);
                break;
            case ir::SemanticVariableKind::Identifier:
                // Pre-increment keeps numbering identical to the legacy builder.
                variable.name = variable.identifier + "_r" + std::to_string(++state.index);
                break;
            default:
                variable.name = "_r" + std::to_string(++state.index);
                break;
        }
    }
    return *variable.name;
}

void backfill_variable_names(CompilationUnit& unit, const VariableNameTable& names){
    for(ir::Op* op : unit.ops()){
        ir::visit_expressions_in_op(*op, [&](ir::Expression& e){
            auto* read = ir::as_read_variable(e);
            if(!read || read->name) return;
            auto it = names.find(read->xref);
            if(it == names.end())
                throw naming_error(NamingErrorKind::VariableNotNamed, "variable " + std::to_string(read->xref) + " not yet named", unit.xref());
            read->name = it->second;
            if(trace_naming()) std::fprintf(stderr, "[dbg][naming][read] unit=%u xref=%u name=%s\n", unit.xref(), read->xref, it->second.c_str());
        });
    }
}

} // namespace tmplc::phases
