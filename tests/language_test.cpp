#include <gtest/gtest.h>
#include <exception>
#include "luma/lang/luma.hpp"
#include "luma/parser.hpp"

using namespace luma;

TEST(LanguageTest, LoadsLumaGrammar){
    try {
        Parser parser(Language(lang::language()));
        ASSERT_TRUE(parser.language().has_value());
    } catch(const std::exception& e){
        FAIL() << "Error loading Luma grammar: " << e.what();
    }
}

TEST(LanguageTest, ReportsNameVersionAndRoot){
    Language luma_lang(lang::language());
    EXPECT_EQ(luma_lang.name(), "luma");
    EXPECT_GE(luma_lang.version(), kMinCompatibleLanguageVersion);
    EXPECT_LE(luma_lang.version(), kLanguageVersion);
    EXPECT_EQ(luma_lang.symbol_name(luma_lang.root_symbol()), "source_file");
    EXPECT_GT(luma_lang.symbol_count(), 100u);
}

TEST(LanguageTest, NullHandleIsRejected){
    EXPECT_THROW(Language(nullptr), LanguageError);
}

TEST(LanguageTest, IncompatibleVersionIsRejected){
    LanguageDef def = *lang::language();
    def.version = kLanguageVersion + 1;
    EXPECT_THROW({ Language l(&def); (void)l; }, LanguageError);
    def.version = 0;
    EXPECT_THROW({ Language l(&def); (void)l; }, LanguageError);
}

TEST(LanguageTest, MalformedTablesAreRejected){
    LanguageDef def = *lang::language();
    def.root_symbol = static_cast<Symbol>(def.symbol_count);
    EXPECT_THROW({ Language l(&def); (void)l; }, LanguageError);
    def = *lang::language();
    def.parse = nullptr;
    EXPECT_THROW({ Language l(&def); (void)l; }, LanguageError);
}

TEST(LanguageTest, SymbolLookupDistinguishesNamedKinds){
    Language luma_lang(lang::language());
    auto char_node = luma_lang.symbol_for_name("char", true);
    auto char_kw = luma_lang.symbol_for_name("char", false);
    ASSERT_TRUE(char_node.has_value());
    ASSERT_TRUE(char_kw.has_value());
    EXPECT_NE(*char_node, *char_kw);
    EXPECT_TRUE(luma_lang.symbol_is_named(*char_node));
    EXPECT_FALSE(luma_lang.symbol_is_named(*char_kw));
    EXPECT_EQ(luma_lang.symbol_for_name("ERROR", true).value_or(0), kErrorSymbol);
    EXPECT_EQ(luma_lang.symbol_name(kErrorSymbol), "ERROR");
    EXPECT_FALSE(luma_lang.symbol_for_name("no_such_kind", true).has_value());
    EXPECT_TRUE(luma_lang.symbol_name(static_cast<Symbol>(luma_lang.symbol_count())).empty());
}

TEST(LanguageTest, HandlesCompareByDefinition){
    Language a(lang::language());
    Language b(lang::language());
    EXPECT_TRUE(a == b);
    LanguageDef copy = *lang::language();
    Language c(&copy);
    EXPECT_TRUE(a != c);
}
