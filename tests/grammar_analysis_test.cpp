#include <gtest/gtest.h>
#include <tao/pegtl/contrib/analyze.hpp>
#include "parser/pegtl/grammar.hpp"

// PEGTL's static analysis reports rules that could loop without consuming input.
TEST(GrammarAnalysisTest, NoInfiniteLoops){
    EXPECT_EQ(tao::pegtl::analyze<luma::lang::pegtl_front::grammar::source_file>(1), 0u);
}
