#include <gtest/gtest.h>

// Linked against GTest::gtest only; the runner is provided here.
int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
