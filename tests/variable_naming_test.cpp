#include <gtest/gtest.h>
#include "tmplc/phases/naming.hpp"

using namespace tmplc;
using namespace tmplc::phases;

TEST(VariableNaming, ContextReadsCounterThenIncrements){
    NamingState state;
    auto v = ir::context_variable(0);
    EXPECT_EQ(get_variable_name(*v, state), "ctx_r0");
    EXPECT_EQ(state.index, 1);
}

TEST(VariableNaming, IdentifierIncrementsBeforeReading){
    NamingState state;
    auto v = ir::identifier_variable("item");
    EXPECT_EQ(get_variable_name(*v, state), "item_r1");
    EXPECT_EQ(state.index, 1);
}

TEST(VariableNaming, OtherKindsUseBareSuffix){
    NamingState state;
    auto v = ir::saved_view_variable(0);
    EXPECT_EQ(get_variable_name(*v, state), "_r1");
}

TEST(VariableNaming, MixedSequenceMatchesLegacyNumbering){
    NamingState state;
    auto c1 = ir::context_variable(0);
    auto item = ir::identifier_variable("item");
    auto c2 = ir::context_variable(1);
    auto saved = ir::saved_view_variable(0);
    EXPECT_EQ(get_variable_name(*c1, state), "ctx_r0");
    EXPECT_EQ(get_variable_name(*item, state), "item_r2");
    EXPECT_EQ(get_variable_name(*c2, state), "ctx_r2");
    EXPECT_EQ(get_variable_name(*saved, state), "_r4");
    EXPECT_EQ(state.index, 4);
}

TEST(VariableNaming, NameIsWrittenOnce){
    NamingState state;
    auto v = ir::identifier_variable("row");
    std::string first = get_variable_name(*v, state);
    std::string second = get_variable_name(*v, state);
    EXPECT_EQ(first, "row_r1");
    EXPECT_EQ(first, second);
    EXPECT_EQ(state.index, 1);
}

TEST(VariableNaming, PresetNameIsKept){
    NamingState state;
    auto v = ir::context_variable(0);
    v->name = "ctx";
    EXPECT_EQ(get_variable_name(*v, state), "ctx");
    EXPECT_EQ(state.index, 0);
}

TEST(VariableNaming, ContextNamesStrictlyIncrease){
    NamingState state;
    int previous = -1;
    for(int i = 0; i < 16; ++i){
        auto v = ir::context_variable(0);
        auto name = get_variable_name(*v, state);
        ASSERT_EQ(name.rfind("ctx_r", 0), 0u) << name;
        int n = std::stoi(name.substr(5));
        EXPECT_GT(n, previous);
        previous = n;
    }
}
