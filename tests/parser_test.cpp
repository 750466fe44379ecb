#include <gtest/gtest.h>
#include <string>
#include "luma/env.hpp"
#include "luma/lang/luma.hpp"
#include "luma/parser.hpp"
#include "test_env.hpp"

using namespace luma;

namespace {

Parser lenient_parser(){
    Parser p(Language(lang::language()));
    p.set_options(ParseOptions{});
    return p;
}

} // namespace

TEST(ParserTest, ParserWithoutLanguageThrows){
    Parser p;
    EXPECT_FALSE(p.language().has_value());
    EXPECT_THROW(p.parse("x;"), ParseError);
    EXPECT_THROW(p.parse_string("x;"), ParseError);
}

TEST(ParserTest, CleanInputHasNoDiagnostics){
    Parser p = lenient_parser();
    auto r = p.parse_string("fn main(): int { let x = 1; return x; }", "main.lx");
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.diagnostics.empty());
    EXPECT_EQ(r.filename, "main.lx");
    ASSERT_FALSE(r.tree.empty());
    EXPECT_FALSE(r.tree.root_node().has_error());
}

TEST(ParserTest, EmptyInputIsAnEmptySourceFile){
    Parser p = lenient_parser();
    Tree t = p.parse("");
    EXPECT_EQ(t.to_sexp(), "(source_file)");
    EXPECT_EQ(p.parse("  \n// only a comment\n").to_sexp(), "(source_file (comment))");
}

TEST(ParserTest, MissingSemicolonIsReported){
    Parser p = lenient_parser();
    auto r = p.parse_string("fn f() { return 1 }");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    const Diagnostic& d = r.diagnostics[0];
    EXPECT_EQ(d.code, "E0002");
    EXPECT_EQ(d.message, "missing ';'");
    EXPECT_EQ(d.hint, "insert ';'");
    EXPECT_EQ(d.line, 1);
    EXPECT_EQ(d.col, 18);
    EXPECT_EQ(d.start_byte, d.end_byte);
}

TEST(ParserTest, UnexpectedInputIsReported){
    Parser p = lenient_parser();
    auto r = p.parse_string("let a = 1;\n}\nlet = 5;");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 2u);
    EXPECT_EQ(r.diagnostics[0].code, "E0001");
    EXPECT_EQ(r.diagnostics[0].message, "unexpected '}'");
    EXPECT_EQ(r.diagnostics[0].line, 2);
    EXPECT_EQ(r.diagnostics[0].col, 1);
    EXPECT_EQ(r.diagnostics[1].message, "unexpected 'let = 5;'");
    EXPECT_EQ(r.diagnostics[1].line, 3);
    // Parsing continues past the errors.
    EXPECT_EQ(r.tree.root_node().named_child(0).type(), "statement");
}

TEST(ParserTest, RecoveryKeepsFollowingStatements){
    Parser p = lenient_parser();
    Tree t = p.parse("fn f() { oops here; let y = 2; }");
    Node block = t.root_node().named_child(0).named_child(0).child_by_type("block");
    ASSERT_FALSE(block.is_null());
    EXPECT_TRUE(block.named_child(0).is_error());
    EXPECT_EQ(block.named_child(0).text(), "oops here;");
    EXPECT_EQ(block.named_child(1).named_child(0).type(), "let_declaration");
}

TEST(ParserTest, StrictModeThrowsWithPosition){
    Parser p = lenient_parser();
    ParseOptions o = p.options();
    o.strict = true;
    p.set_options(o);
    EXPECT_NO_THROW(p.parse("let x = 1;"));
    try {
        p.parse("let x = 1", "s.lx");
        FAIL() << "expected ParseError";
    } catch(const ParseError& e){
        EXPECT_EQ(std::string(e.what()), "s.lx:1:10: missing ';'");
        EXPECT_EQ(e.line, 1);
        EXPECT_EQ(e.col, 10);
    }
}

TEST(ParserTest, NestingLimitBecomesDiagnostic){
    Parser p = lenient_parser();
    ParseOptions o = p.options();
    o.max_depth = 8;
    p.set_options(o);
    auto r = p.parse_string("let x = ((((((1))))));");
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, "E0003");
    EXPECT_TRUE(r.tree.empty());
    EXPECT_THROW(p.parse("let x = ((((((1))))));"), NestingError);

    o.max_depth = kDefaultMaxDepth;
    p.set_options(o);
    EXPECT_TRUE(p.parse_string("let x = ((((((1))))));").success);
}

TEST(ParserTest, UnclosedGroupsHitTheNestingLimit){
    Parser p = lenient_parser();
    auto r = p.parse_string(std::string(200000, '{'));
    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, "E0003");

    auto shallow = p.parse_string("{ { x; } }");
    ASSERT_EQ(shallow.diagnostics.size(), 1u);
    EXPECT_EQ(shallow.diagnostics[0].code, "E0001");
}

TEST(ParserTest, OversizedMaxDepthIsClamped){
    Parser p = lenient_parser();
    ParseOptions o = p.options();
    o.max_depth = 1000000;
    p.set_options(o);
    std::string deep = "let x = " + std::string(2000, '(') + "1" + std::string(2000, ')') + ";";
    auto r = p.parse_string(deep);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].code, "E0003");
    EXPECT_EQ(p.parse_string(std::string(5000, '{')).diagnostics[0].code, "E0003");
}

TEST(ParserTest, KeywordsAreNamesWhereOnlyANameFits){
    Parser p = lenient_parser();
    for(const char* src : {"let from = 1;", "fn in(x: int) {}", "a.type;", "struct S { type: int }",
                           "enum E { if, else }", "for as in xs {}", "import loop;"}){
        auto r = p.parse_string(src);
        EXPECT_TRUE(r.success) << src;
    }
    // Where a statement or expression may start, keywords stay reserved.
    EXPECT_FALSE(p.parse_string("from;").success);
    EXPECT_FALSE(p.parse_string("let x = type;").success);
    Tree t = p.parse("let return = 1;");
    EXPECT_EQ(t.root_node().named_child(0).named_child(0).child_by_type("identifier").text(), "return");
}

TEST(ParserTest, ErrorNodesKeepRecoveredNames){
    Parser p = lenient_parser();
    Tree t = p.parse("@@ foo 42;");
    Node err = t.root_node().named_child(0);
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.start_byte(), 0u);
    ASSERT_EQ(err.named_child_count(), 2u);
    EXPECT_EQ(err.named_child(0).type(), "identifier");
    EXPECT_EQ(err.named_child(0).text(), "foo");
    EXPECT_EQ(err.named_child(1).text(), "42");
    EXPECT_EQ(t.to_sexp(), "(source_file (ERROR (identifier) (number)))");
}

TEST(ParserTest, OptionsComeFromEnvironment){
    {
        ScopedEnv strict("LUMA_STRICT", "1");
        ScopedEnv depth("LUMA_MAX_DEPTH", "64");
        Parser p(Language(lang::language()));
        EXPECT_TRUE(p.options().strict);
        EXPECT_EQ(p.options().max_depth, 64u);
    }
    {
        ScopedEnv strict("LUMA_STRICT", "0");
        ScopedEnv depth("LUMA_MAX_DEPTH", "deep");
        ParseOptions o = detect_parse_options();
        EXPECT_FALSE(o.strict);
        EXPECT_EQ(o.max_depth, kDefaultMaxDepth);
    }
}

TEST(ParserTest, DebugTraceDoesNotChangeResult){
    Parser p = lenient_parser();
    ParseOptions o = p.options();
    o.debug = true;
    p.set_options(o);
    ::testing::internal::CaptureStderr();
    auto r = p.parse_string("let x = 1", "dbg.lx");
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_FALSE(r.success);
    EXPECT_NE(err.find("[dbg][luma][parse] file=dbg.lx"), std::string::npos);
    EXPECT_NE(err.find("E0002"), std::string::npos);
}
