#include <gtest/gtest.h>
#include "test_env.hpp"
#include "tmplc/diagnostics_json.hpp"
#include "tmplc/phases/naming.hpp"
#include "tmplc/text/loader.hpp"

using namespace tmplc;

namespace {

naming_error naming_failure(const char* src){
    auto job = text::read_job(src);
    try {
        phases::phase_naming(*job);
    } catch(const naming_error& e){
        return e;
    }
    throw std::logic_error("naming unexpectedly succeeded");
}

} // namespace

TEST(Diagnostics, NamingErrorCarriesCodeHintAndUnit){
    auto e = naming_failure("(job :name \"C\" (view :update [ (statement (read-var 9)) ]))");
    auto d = make_diagnostic(e);
    EXPECT_EQ(d.code, "E0103");
    EXPECT_EQ(d.message.rfind("E0103: ", 0), 0u) << d.message;
    EXPECT_FALSE(d.hint.empty());
    ASSERT_EQ(d.notes.size(), 1u);
    EXPECT_EQ(d.notes[0].message, "while naming unit 0");
}

TEST(Diagnostics, TextErrorCarriesPosition){
    try {
        text::read_job("(job :name \"C\"\n  (view :create [ (listener :target 1) ]))");
        FAIL() << "expected load_error";
    } catch(const text_error& e){
        auto d = make_diagnostic(e);
        EXPECT_EQ(d.code, "E0002");
        EXPECT_EQ(d.line, 2);
        EXPECT_GT(d.col, 0);
        EXPECT_TRUE(d.notes.empty());
    }
}

TEST(Diagnostics, JsonShape){
    EXPECT_EQ(diagnostics_to_json({}), "{\"success\":true,\"errors\":[]}");

    Diagnostic d;
    d.code = "E0101";
    d.message = "slot \"missing\"";
    d.hint = "h";
    d.notes.push_back(DiagnosticNote{"while naming unit 3", -1, -1});
    auto js = diagnostics_to_json({d});
    EXPECT_EQ(js,
        "{\"success\":false,\"errors\":[{\"code\":\"E0101\",\"message\":\"slot \\\"missing\\\"\",\"line\":-1,\"col\":-1,"
        "\"hint\":\"h\",\"notes\":[{\"message\":\"while naming unit 3\",\"line\":-1,\"col\":-1}]}]}");
}

TEST(Diagnostics, JsonEscapesControlCharacters){
    EXPECT_EQ(json_escape("a\tb\x01"), "\"a\\tb\\u0001\"");
}

TEST(Diagnostics, JsonPrintedOnlyWhenEnabled){
    {
        ScopedEnv env("TMPLC_DIAG_JSON", "");
        testing::internal::CaptureStderr();
        maybe_print_json({});
        EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
    }
    {
        ScopedEnv env("TMPLC_DIAG_JSON", "1");
        testing::internal::CaptureStderr();
        maybe_print_json({});
        EXPECT_EQ(testing::internal::GetCapturedStderr(), "{\"success\":true,\"errors\":[]}\n");
    }
}

TEST(Diagnostics, NamingTraceFollowsDebugFlag){
    auto job = text::read_job(R"EDN(
      (job :name "C"
        (view :create [ (listener :target 1 :tag "a" :slot 0 :name "click")
                        (variable :xref 2 :kind context :view 0) ]
              :update [ (statement (read-var 2)) ]))
    )EDN");
    ScopedEnv env("TMPLC_DEBUG_NAMING", "1");
    testing::internal::CaptureStderr();
    phases::phase_naming(*job);
    auto out = testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("[dbg][naming][unit] xref=0 base=C fn=C_Template"), std::string::npos) << out;
    EXPECT_NE(out.find("[dbg][naming][listener] unit=0 handler=C_Template_a_click_0_listener"), std::string::npos) << out;
    EXPECT_NE(out.find("[dbg][naming][variable] unit=0 xref=2 name=ctx_r0"), std::string::npos) << out;
    EXPECT_NE(out.find("[dbg][naming][read] unit=0 xref=2 name=ctx_r0"), std::string::npos) << out;
}

TEST(Diagnostics, JsonListsEveryDiagnosticWithPositions){
    Diagnostic a;
    a.code = "E0001";
    a.message = "bad";
    a.line = 3;
    a.col = 7;
    Diagnostic b;
    b.code = "E0106";
    b.message = "view 0 is reached more than once";
    b.notes.push_back(DiagnosticNote{"declared here", 1, 2});
    auto js = diagnostics_to_json({a, b});
    EXPECT_EQ(js,
        "{\"success\":false,\"errors\":["
        "{\"code\":\"E0001\",\"message\":\"bad\",\"line\":3,\"col\":7,\"hint\":\"\",\"notes\":[]},"
        "{\"code\":\"E0106\",\"message\":\"view 0 is reached more than once\",\"line\":-1,\"col\":-1,\"hint\":\"\","
        "\"notes\":[{\"message\":\"declared here\",\"line\":1,\"col\":2}]}]}");
}

TEST(Diagnostics, ReenteredViewHasCodeAndHint){
    auto e = naming_failure("(job :name \"C\" (view :create [ (template :xref 0 :slot 1) ]))");
    auto d = make_diagnostic(e);
    EXPECT_EQ(d.code, "E0106");
    EXPECT_FALSE(d.hint.empty());
}
