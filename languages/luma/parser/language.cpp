#include "luma/lang/luma.hpp"
#include "symbols.hpp"

namespace luma::lang {

void parse_source(std::string_view source, std::string_view filename, luma::TreeBuilder& builder);

namespace {

constexpr luma::SymbolInfo kSymbols[] = {
    {"source_file", true, true},
    {"statement", true, true},
    {"attribute_statement", true, true},
    {"attribute_args", true, true},
    {"let_declaration", true, true},
    {"defer_statement", true, true},
    {"qualified_identifier", true, true},
    {"const_declaration", true, true},
    {"function_declaration", true, true},
    {"parameter_list", true, true},
    {"parameter", true, true},
    {"type_declaration", true, true},
    {"struct_declaration", true, true},
    {"struct_body", true, true},
    {"struct_field", true, true},
    {"enum_declaration", true, true},
    {"enum_body", true, true},
    {"enum_variant", true, true},
    {"import_statement", true, true},
    {"export_statement", true, true},
    {"expression_statement", true, true},
    {"control_statement", true, true},
    {"if_statement", true, true},
    {"while_statement", true, true},
    {"for_statement", true, true},
    {"loop_statement", true, true},
    {"return_statement", true, true},
    {"break_statement", true, true},
    {"continue_statement", true, true},
    {"switch_statement", true, true},
    {"switch_case", true, true},
    {"switch_default", true, true},
    {"module_declaration", true, true},
    {"namespace_declaration", true, true},
    {"block", true, true},
    {"type", true, true},
    {"primitive_type", true, true},
    {"function_expression", true, true},
    {"expression", true, true},
    {"call_expression", true, true},
    {"argument_list", true, true},
    {"member_expression", true, true},
    {"binary_expression", true, true},
    {"unary_expression", true, true},
    {"parenthesized_expression", true, true},
    {"cast_expression", true, true},
    {"literal", true, true},
    {"number", true, true},
    {"string", true, true},
    {"char", true, true},
    {"escape_sequence", true, true},
    {"boolean", true, true},
    {"array_literal", true, true},
    {"identifier", true, true},
    {"comment", true, true},

    {"@", false, true},
    {"as", false, true},
    {";", false, true},
    {"(", false, true},
    {")", false, true},
    {",", false, true},
    {"let", false, true},
    {":", false, true},
    {"=", false, true},
    {"defer", false, true},
    {"::", false, true},
    {"const", false, true},
    {"fn", false, true},
    {"type", false, true},
    {"struct", false, true},
    {"{", false, true},
    {"}", false, true},
    {"enum", false, true},
    {"import", false, true},
    {"from", false, true},
    {"export", false, true},
    {"if", false, true},
    {"else", false, true},
    {"while", false, true},
    {"for", false, true},
    {"in", false, true},
    {"loop", false, true},
    {"return", false, true},
    {"break", false, true},
    {"continue", false, true},
    {"switch", false, true},
    {"case", false, true},
    {"default", false, true},
    {"module", false, true},
    {"namespace", false, true},
    {"[", false, true},
    {"]", false, true},
    {"<", false, true},
    {">", false, true},
    {"*", false, true},
    {"int", false, true},
    {"float", false, true},
    {"bool", false, true},
    {"char", false, true},
    {"string", false, true},
    {"void", false, true},
    {".", false, true},
    {"+", false, true},
    {"-", false, true},
    {"/", false, true},
    {"%", false, true},
    {"==", false, true},
    {"!=", false, true},
    {"<=", false, true},
    {">=", false, true},
    {"&&", false, true},
    {"||", false, true},
    {"+=", false, true},
    {"-=", false, true},
    {"*=", false, true},
    {"/=", false, true},
    {"%=", false, true},
    {"!", false, true},
    {"&", false, true},
    {"\"", false, true},
    {"'", false, true},
    {"\\", false, true},
    {"true", false, true},
    {"false", false, true},
};

static_assert(sizeof(kSymbols) / sizeof(kSymbols[0]) == sym::count_, "symbol table out of sync with sym enum");

constexpr luma::LanguageDef kLuma = {
    luma::kLanguageVersion,
    "luma",
    kSymbols,
    sym::count_,
    sym::source_file,
    &parse_source,
};

} // namespace

const luma::LanguageDef* language(){ return &kLuma; }

} // namespace luma::lang
