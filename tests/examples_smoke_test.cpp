// Examples smoke test: load each job under examples/jobs, name it, check the generated names.
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include "tmplc/phases/naming.hpp"
#include "tmplc/text/loader.hpp"
#include "tmplc/text/printer.hpp"

using namespace tmplc;

namespace {

std::string read_all(const std::filesystem::path& p){
    std::ifstream ifs(p, std::ios::binary); if(!ifs) return {};
    std::string s; ifs.seekg(0,std::ios::end); s.resize((size_t)ifs.tellg()); ifs.seekg(0); ifs.read(&s[0], s.size()); return s;
}

// Names produced for one job, keyed by where they were assigned.
struct NamedJob {
    std::map<ir::XrefId, std::string> unit_fns;
    std::vector<std::string> handlers;
    std::vector<std::string> events;
    std::map<ir::XrefId, std::string> variables;
    std::vector<std::string> reads;
    std::vector<std::string> props;
};

NamedJob load_and_name(const char* file){
#ifndef TMPLC_SOURCE_DIR
    (void)file;
    return {};
#else
    auto path = std::filesystem::path(TMPLC_SOURCE_DIR)/"examples"/"jobs"/file;
    auto src = read_all(path);
    EXPECT_FALSE(src.empty()) << "missing example " << path;
    auto job = text::read_job(src, path.string());
    phases::phase_naming(*job);
    NamedJob out;
    for(auto* unit : job->units()){
        out.unit_fns[unit->xref()] = unit->fn_name.value_or("");
        unit->for_each_op([&](ir::Op& op){
            if(auto* l = std::get_if<ir::ListenerOp>(&op.data)){ out.handlers.push_back(l->handler_fn_name.value_or("")); out.events.push_back(l->name); }
            if(auto* v = std::get_if<ir::VariableOp>(&op.data)) out.variables[v->xref] = v->variable->name.value_or("");
            if(auto* p = std::get_if<ir::StylePropOp>(&op.data)) out.props.push_back(p->name);
            if(auto* p = std::get_if<ir::ClassPropOp>(&op.data)) out.props.push_back(p->name);
            if(auto* p = std::get_if<ir::HostPropertyOp>(&op.data)) out.props.push_back(p->name);
            ir::visit_expressions_in_op(op, [&](ir::Expression& e){ if(auto* r = ir::as_read_variable(e)) out.reads.push_back(r->name.value_or("")); });
        });
    }
    // Printed output must read back.
    EXPECT_NO_THROW(text::read_job(text::print_job(*job)));
    return out;
#endif
}

} // namespace

TEST(ExamplesSmoke, ConditionalList){
#ifndef TMPLC_SOURCE_DIR
    GTEST_SKIP() << "TMPLC_SOURCE_DIR not defined";
#endif
    auto named = load_and_name("conditional_list.edn");
    EXPECT_EQ(named.unit_fns[0], "TodoList_Template");
    EXPECT_EQ(named.unit_fns[10], "TodoList_Conditional_1_Template");
    EXPECT_EQ(named.unit_fns[11], "TodoList_For_3_Template");
    EXPECT_EQ(named.unit_fns[12], "TodoList_ForEmpty_4_Template");

    EXPECT_EQ(named.handlers, (std::vector<std::string>{"TodoList_Template_todo_header_clear_0_listener",
                                                        "TodoList_For_3_Template_li_click_0_listener"}));
    EXPECT_EQ(named.variables[20], "ctx_r0");
    EXPECT_EQ(named.variables[21], "ctx_r1");
    EXPECT_EQ(named.variables[22], "item_r3");
    EXPECT_EQ(named.variables[23], "item_r4");
    EXPECT_EQ(named.reads, (std::vector<std::string>{"item_r4", "item_r3"}));
    EXPECT_EQ(named.props, (std::vector<std::string>{"background-color", "--accent", "done"}));
}

TEST(ExamplesSmoke, HostBindings){
#ifndef TMPLC_SOURCE_DIR
    GTEST_SKIP() << "TMPLC_SOURCE_DIR not defined";
#endif
    auto named = load_and_name("host_bindings.edn");
    EXPECT_EQ(named.unit_fns[0], "Tooltip_HostBindings");
    EXPECT_EQ(named.handlers, (std::vector<std::string>{"Tooltip_mouseenter_HostBindingHandler",
                                                        "Tooltip_animation_fade_done_HostBindingHandler"}));
    EXPECT_EQ(named.events, (std::vector<std::string>{"mouseenter", "@fade.done"}));
    EXPECT_EQ(named.props, (std::vector<std::string>{"@fade", "max-width", "visible!important"}));
}
