#include <exception>
#include <iostream>
#include "test_env.hpp"
// Only GTest::gtest is linked (not gtest_main): the assert-style suites run first,
// then any GoogleTest cases compiled into this binary.
#include <gtest/gtest.h>

void run_tree_builder_tests();
void run_tree_tests();
void run_diagnostics_tests();

int main(int argc, char** argv){
    try{
        run_tree_builder_tests();
        run_tree_tests();
        run_diagnostics_tests();
    }catch(const std::exception& e){ std::cerr << "[luma_tests] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
