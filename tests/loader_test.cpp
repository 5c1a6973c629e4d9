#include <gtest/gtest.h>
#include "tmplc/phases/naming.hpp"
#include "tmplc/text/loader.hpp"
#include "tmplc/text/printer.hpp"

using namespace tmplc;
using namespace tmplc::text;

namespace {

const char* kComponentJob = R"EDN(
(job :kind component :name "Comp" :compat tdb
  (view :xref 0
    :create [ (element-start :xref 1 :tag "button" :slot 0)
              (listener :target 1 :tag "button" :slot 0 :name "click"
                        :handler [ (statement (call (prop (ctx 0) "save") (read-var 5)))
                                   (variable :xref 5 :kind identifier :identifier "event") ])
              (element-end :xref 1)
              (template :xref 2 :slot 1 :suffix "Conditional") ]
    :update [ (advance :delta 1)
              (property :target 1 :name "disabled" :expr (not (lexical "enabled")))
              (style-prop :target 1 :name "fontSize" :expr 12 :unit "px")
              (class-prop :target 1 :name "active" :expr true) ])
  (view :xref 2 :parent 0 :fn "Preset"
    :create [ (text :xref 3 :value "hi" :slot 0) ]
    :update [ (statement (interp ["a" "b"] [(binary "+" 1 2)])) ]))
)EDN";

} // namespace

TEST(Loader, ReadsComponentJob){
    auto job = read_job(kComponentJob);
    auto* component = dynamic_cast<ComponentCompilationJob*>(job.get());
    ASSERT_NE(component, nullptr);
    EXPECT_EQ(job->component_name(), "Comp");
    EXPECT_EQ(job->compatibility(), CompatibilityMode::TemplateDefinitionBuilder);
    ASSERT_EQ(component->views().size(), 2u);

    auto& root = component->root();
    EXPECT_FALSE(root.fn_name.has_value());
    ASSERT_EQ(root.create.size(), 4u);
    ASSERT_EQ(root.update.size(), 4u);
    EXPECT_EQ(root.create[1]->kind(), ir::OpKind::Listener);
    auto& l = std::get<ir::ListenerOp>(root.create[1]->data);
    EXPECT_EQ(*l.tag, "button");
    EXPECT_EQ(*l.target_slot.slot, 0);
    EXPECT_EQ(l.handler_ops.size(), 2u);
    EXPECT_EQ(std::get<ir::StylePropOp>(root.update[2]->data).unit.value_or(""), "px");

    auto* child = dynamic_cast<ViewCompilationUnit*>(job->find_view(2));
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->parent().value_or(99), 0u);
    EXPECT_EQ(child->fn_name.value_or(""), "Preset");
}

TEST(Loader, ReadsHostJob){
    auto job = read_job(R"EDN(
      (job :kind host :name "Tip"
        (host :create [ (listener :host true :name "click") ]
              :update [ (host-property :name "title" :expr title) ]))
    )EDN");
    EXPECT_EQ(job->root().kind(), UnitKind::HostBinding);
    EXPECT_EQ(job->compatibility(), CompatibilityMode::Full);
    EXPECT_STREQ(job->fn_suffix(), "HostBindings");
    ASSERT_EQ(job->root().create.size(), 1u);
    EXPECT_TRUE(std::get<ir::ListenerOp>(job->root().create[0]->data).host_listener);
    auto& prop = std::get<ir::HostPropertyOp>(job->root().update[0]->data);
    EXPECT_EQ(std::get<ir::LexicalReadExpr>(prop.expression->data).name, "title");
}

TEST(Loader, OptionsOverrideDeclaredValues){
    LoadOptions opts;
    opts.compatibility = CompatibilityMode::Full;
    opts.component_name = "Other";
    auto job = read_job(kComponentJob, "<test>", opts);
    EXPECT_EQ(job->component_name(), "Other");
    EXPECT_EQ(job->compatibility(), CompatibilityMode::Full);
}

TEST(Loader, AllocatedXrefsAvoidLoadedOnes){
    auto job = read_job(kComponentJob);
    auto* component = dynamic_cast<ComponentCompilationJob*>(job.get());
    ASSERT_NE(component, nullptr);
    auto& fresh = component->allocate_view(0);
    EXPECT_GT(fresh.xref(), 5u);
}

TEST(Loader, MissingRequiredArgument){
    try {
        read_job("(job :name \"C\" (view :create [ (element-start :xref 1 :slot 0) ]))");
        FAIL() << "expected load_error";
    } catch(const load_error& e){
        EXPECT_EQ(e.code, "E0002");
        EXPECT_NE(std::string(e.what()).find(":tag"), std::string::npos);
        EXPECT_EQ(e.line, 1);
    }
}

TEST(Loader, RejectsMalformedJobs){
    EXPECT_THROW(read_job("(module :name \"C\" (view))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\")"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :xref 3))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view) (view :xref 1) (view :xref 1))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" :compat legacy (view))"), load_error);
    EXPECT_THROW(read_job("(job :kind host :name \"C\" (view))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :create [ (frobnicate) ]))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :create [ (template :xref -1 :slot 0) ]))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :update [ (statement (interp [\"a\"] [1])) ]))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :create [ (variable :xref 1 :kind bogus) ]))"), load_error);
}

TEST(Loader, SyntaxErrorsStayParseErrors){
    EXPECT_THROW(read_job("(job :name \"C\" (view)"), parse_error);
}

TEST(Printer, NamedJobReadsBackIdentically){
    auto job = read_job(kComponentJob);
    phases::phase_naming(*job);
    auto printed = print_job(*job);
    auto again = read_job(printed);
    EXPECT_EQ(print_job(*again), printed);
    EXPECT_EQ(print_job(*again, false), print_job(*job, false));
}

TEST(Printer, WritesAssignedNames){
    auto job = read_job(kComponentJob);
    phases::phase_naming(*job);
    auto printed = print_job(*job, false);
    EXPECT_NE(printed.find(":handler-fn \"Comp_Template_button_click_0_listener\""), std::string::npos) << printed;
    EXPECT_NE(printed.find("(read-var 5 :name \"event_r1\")"), std::string::npos) << printed;
    EXPECT_NE(printed.find(":name \"font-size\""), std::string::npos) << printed;
    EXPECT_NE(printed.find(":fn \"Preset\""), std::string::npos) << printed;
    EXPECT_NE(printed.find(":fn \"Comp_Template\""), std::string::npos) << printed;
}

TEST(Loader, SlotsOutsideTheInt32RangeAreRejected){
    try {
        read_job("(job :name \"C\" (view :create [ (template :xref 1 :slot 4294967297) ]) (view :xref 1))");
        FAIL() << "expected load_error";
    } catch(const load_error& e){
        EXPECT_NE(std::string(e.what()).find("out of range"), std::string::npos) << e.what();
    }
    EXPECT_THROW(read_job("(job :name \"C\" (view :create [ (element-start :xref 1 :tag \"a\" :slot -1) ]))"), load_error);
    auto job = read_job("(job :name \"C\" (view :create [ (element-start :xref 1 :tag \"a\" :slot 2147483647) ]))");
    EXPECT_EQ(*std::get<ir::ElementStartOp>(job->root().create[0]->data).handle.slot, 2147483647);
}

TEST(Loader, XrefsOutsideTheUint32RangeAreRejected){
    EXPECT_THROW(read_job("(job :name \"C\" (view) (view :xref 4294967296))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view) (view :xref 1 :parent -2))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :create [ (element-end :xref 4294967297) ]))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :update [ (statement (read-var 4294967296)) ]))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :update [ (statement (ctx -1)) ]))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :create [ (variable :xref 1 :kind context :view 4294967296) ]))"), load_error);
    EXPECT_THROW(read_job("(job :name \"C\" (view :update [ (advance :delta 4294967296) ]))"), load_error);
}

TEST(Loader, DuplicateKeywordIsRejected){
    try {
        read_job("(job :name \"C\"\n  (view :create [ (element-start :xref 1 :tag \"a\" :tag \"b\" :slot 0) ]))");
        FAIL() << "expected load_error";
    } catch(const load_error& e){
        EXPECT_NE(std::string(e.what()).find(":tag given twice"), std::string::npos) << e.what();
        EXPECT_EQ(e.line, 2);
    }
    EXPECT_THROW(read_job("(job :name \"C\" :name \"D\" (view))"), load_error);
}
