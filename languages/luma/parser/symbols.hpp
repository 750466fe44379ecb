#pragma once
#include "luma/language.hpp"

namespace luma::lang {

// Node kinds of the Luma grammar. Order must match the table in language.cpp.
namespace sym {
enum : luma::Symbol {
    // named
    source_file,
    statement,
    attribute_statement,
    attribute_args,
    let_declaration,
    defer_statement,
    qualified_identifier,
    const_declaration,
    function_declaration,
    parameter_list,
    parameter,
    type_declaration,
    struct_declaration,
    struct_body,
    struct_field,
    enum_declaration,
    enum_body,
    enum_variant,
    import_statement,
    export_statement,
    expression_statement,
    control_statement,
    if_statement,
    while_statement,
    for_statement,
    loop_statement,
    return_statement,
    break_statement,
    continue_statement,
    switch_statement,
    switch_case,
    switch_default,
    module_declaration,
    namespace_declaration,
    block,
    type,
    primitive_type,
    function_expression,
    expression,
    call_expression,
    argument_list,
    member_expression,
    binary_expression,
    unary_expression,
    parenthesized_expression,
    cast_expression,
    literal,
    number,
    string,
    char_literal,
    escape_sequence,
    boolean,
    array_literal,
    identifier,
    comment,
    // anonymous
    at_sign,
    kw_as,
    semicolon,
    lparen,
    rparen,
    comma,
    kw_let,
    colon,
    equals,
    kw_defer,
    double_colon,
    kw_const,
    kw_fn,
    kw_type,
    kw_struct,
    lbrace,
    rbrace,
    kw_enum,
    kw_import,
    kw_from,
    kw_export,
    kw_if,
    kw_else,
    kw_while,
    kw_for,
    kw_in,
    kw_loop,
    kw_return,
    kw_break,
    kw_continue,
    kw_switch,
    kw_case,
    kw_default,
    kw_module,
    kw_namespace,
    lbracket,
    rbracket,
    lt,
    gt,
    star,
    kw_int,
    kw_float,
    kw_bool,
    kw_char,
    kw_string,
    kw_void,
    dot,
    plus,
    minus,
    slash,
    percent,
    eq_eq,
    not_eq_,
    lt_eq,
    gt_eq,
    and_and,
    or_or,
    plus_eq,
    minus_eq,
    star_eq,
    slash_eq,
    percent_eq,
    bang,
    amp,
    dquote,
    squote,
    backslash,
    kw_true,
    kw_false,

    count_
};
} // namespace sym

} // namespace luma::lang
