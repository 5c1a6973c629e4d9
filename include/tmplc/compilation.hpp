// Compilation jobs and units: the arena that owns every view of one template compile.
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tmplc/ir/ops.hpp"

namespace tmplc {

using ir::XrefId;

enum class CompatibilityMode {
    Full,
    // Reproduce the naming/formatting quirks of the legacy template definition builder.
    TemplateDefinitionBuilder
};

enum class UnitKind { View, HostBinding };

class CompilationJob;

// One scope of instructions: the root component view, an embedded view, or host bindings.
class CompilationUnit {
public:
    CompilationUnit(CompilationJob& job, XrefId xref, UnitKind kind): job_(job), xref_(xref), kind_(kind){}
    virtual ~CompilationUnit() = default;
    CompilationUnit(const CompilationUnit&) = delete;
    CompilationUnit& operator=(const CompilationUnit&) = delete;

    CompilationJob& job() const { return job_; }
    XrefId xref() const { return xref_; }
    UnitKind kind() const { return kind_; }

    // Generated function name. Write-once: passes only set it when absent.
    std::optional<std::string> fn_name;

    ir::OpList create;
    ir::OpList update;

    // Flattened iteration: create ops (each listener followed by its handler ops), then update ops.
    void for_each_op(const std::function<void(ir::Op&)>& fn);
    std::vector<ir::Op*> ops();

private:
    CompilationJob& job_;
    XrefId xref_;
    UnitKind kind_;
};

class ViewCompilationUnit : public CompilationUnit {
public:
    ViewCompilationUnit(CompilationJob& job, XrefId xref, std::optional<XrefId> parent)
        : CompilationUnit(job, xref, UnitKind::View), parent_(parent){}
    std::optional<XrefId> parent() const { return parent_; }
private:
    std::optional<XrefId> parent_;
};

class HostBindingCompilationUnit : public CompilationUnit {
public:
    HostBindingCompilationUnit(CompilationJob& job, XrefId xref): CompilationUnit(job, xref, UnitKind::HostBinding){}
};

class CompilationJob {
public:
    CompilationJob(std::string component_name, CompatibilityMode compatibility)
        : component_name_(std::move(component_name)), compatibility_(compatibility){}
    virtual ~CompilationJob() = default;
    CompilationJob(const CompilationJob&) = delete;
    CompilationJob& operator=(const CompilationJob&) = delete;

    const std::string& component_name() const { return component_name_; }
    CompatibilityMode compatibility() const { return compatibility_; }

    // Suffix appended to every generated unit function name.
    virtual const char* fn_suffix() const = 0;
    virtual CompilationUnit& root() = 0;
    // Lookup of a view by xref; nullptr when the xref names no view of this job.
    virtual CompilationUnit* find_view(XrefId xref) = 0;
    virtual std::vector<CompilationUnit*> units() = 0;

    // Fresh xref, never handed out before by this job.
    XrefId allocate_xref_id(){ return next_xref_id_++; }
    // Record an externally chosen xref so later allocations stay clear of it.
    void note_xref_id(XrefId xref){ if(xref >= next_xref_id_) next_xref_id_ = xref + 1; }

private:
    std::string component_name_;
    CompatibilityMode compatibility_;
    XrefId next_xref_id_ = 0;
};

class ComponentCompilationJob : public CompilationJob {
public:
    ComponentCompilationJob(std::string component_name, CompatibilityMode compatibility);

    const char* fn_suffix() const override { return "Template"; }
    ViewCompilationUnit& root() override { return *root_; }
    CompilationUnit* find_view(XrefId xref) override;
    std::vector<CompilationUnit*> units() override;

    // New embedded view with a freshly allocated xref.
    ViewCompilationUnit& allocate_view(XrefId parent);
    // Embedded view with a caller-chosen xref (e.g. read back from text). Throws on reuse.
    ViewCompilationUnit& add_view(XrefId xref, std::optional<XrefId> parent);

    const std::map<XrefId, std::unique_ptr<ViewCompilationUnit>>& views() const { return views_; }

private:
    std::map<XrefId, std::unique_ptr<ViewCompilationUnit>> views_;
    ViewCompilationUnit* root_ = nullptr;
};

class HostBindingCompilationJob : public CompilationJob {
public:
    HostBindingCompilationJob(std::string component_name, CompatibilityMode compatibility);

    const char* fn_suffix() const override { return "HostBindings"; }
    HostBindingCompilationUnit& root() override { return *root_; }
    // Host binding jobs declare no views.
    CompilationUnit* find_view(XrefId) override { return nullptr; }
    std::vector<CompilationUnit*> units() override { return {root_.get()}; }

private:
    std::unique_ptr<HostBindingCompilationUnit> root_;
};

} // namespace tmplc
