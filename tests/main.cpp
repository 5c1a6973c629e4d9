#include <gtest/gtest.h>

// We link GTest::gtest (not gtest_main), so the entry point lives here.
int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
