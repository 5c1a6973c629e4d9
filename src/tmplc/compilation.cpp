#include "tmplc/compilation.hpp"
#include <stdexcept>

namespace tmplc {

void CompilationUnit::for_each_op(const std::function<void(ir::Op&)>& fn){
    for(auto& op : create){
        fn(*op);
        if(auto* l = std::get_if<ir::ListenerOp>(&op->data)){
            for(auto& inner : l->handler_ops) fn(*inner);
        }
    }
    for(auto& op : update) fn(*op);
}

std::vector<ir::Op*> CompilationUnit::ops(){
    std::vector<ir::Op*> out;
    for_each_op([&](ir::Op& op){ out.push_back(&op); });
    return out;
}

ComponentCompilationJob::ComponentCompilationJob(std::string component_name, CompatibilityMode compatibility)
    : CompilationJob(std::move(component_name), compatibility){
    XrefId xref = allocate_xref_id();
    auto unit = std::make_unique<ViewCompilationUnit>(*this, xref, std::nullopt);
    root_ = unit.get();
    views_.emplace(xref, std::move(unit));
}

CompilationUnit* ComponentCompilationJob::find_view(XrefId xref){
    auto it = views_.find(xref);
    return it == views_.end() ? nullptr : it->second.get();
}

std::vector<CompilationUnit*> ComponentCompilationJob::units(){
    std::vector<CompilationUnit*> out; out.reserve(views_.size());
    for(auto& kv : views_) out.push_back(kv.second.get());
    return out;
}

ViewCompilationUnit& ComponentCompilationJob::allocate_view(XrefId parent){
    return add_view(allocate_xref_id(), parent);
}

ViewCompilationUnit& ComponentCompilationJob::add_view(XrefId xref, std::optional<XrefId> parent){
    if(views_.count(xref))
        throw std::invalid_argument("view xref " + std::to_string(xref) + " already in use");
    note_xref_id(xref);
    auto unit = std::make_unique<ViewCompilationUnit>(*this, xref, parent);
    auto& ref = *unit;
    views_.emplace(xref, std::move(unit));
    return ref;
}

HostBindingCompilationJob::HostBindingCompilationJob(std::string component_name, CompatibilityMode compatibility)
    : CompilationJob(std::move(component_name), compatibility){
    root_ = std::make_unique<HostBindingCompilationUnit>(*this, allocate_xref_id());
}

} // namespace tmplc
