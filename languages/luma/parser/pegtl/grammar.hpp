#pragma once
#include "prelude.hpp"
#include <tao/pegtl.hpp>

namespace luma::lang::pegtl_front::grammar {
using namespace tao::pegtl;

// ---------------------------------------------------------------------------
// Whitespace and comments
struct line_comment : seq< two<'/'>, star< not_one<'\n'> > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct comment_text : sor< line_comment, block_comment > {};
struct comment : comment_text, extra_node<sym::comment> {};

struct skip : star< sor< space, comment > > {};
// Node-free twin of skip, for lookahead.
struct skip_text : star< sor< space, comment_text > > {};

template<typename Rule>
struct tok : seq< skip, Rule > {};

// ---------------------------------------------------------------------------
// Keywords
using let_text = keyword<'l','e','t'>;
using const_text = keyword<'c','o','n','s','t'>;
using fn_text = keyword<'f','n'>;
using type_text = keyword<'t','y','p','e'>;
using struct_text = keyword<'s','t','r','u','c','t'>;
using enum_text = keyword<'e','n','u','m'>;
using import_text = keyword<'i','m','p','o','r','t'>;
using from_text = keyword<'f','r','o','m'>;
using export_text = keyword<'e','x','p','o','r','t'>;
using if_text = keyword<'i','f'>;
using else_text = keyword<'e','l','s','e'>;
using while_text = keyword<'w','h','i','l','e'>;
using for_text = keyword<'f','o','r'>;
using in_text = keyword<'i','n'>;
using loop_text = keyword<'l','o','o','p'>;
using return_text = keyword<'r','e','t','u','r','n'>;
using break_text = keyword<'b','r','e','a','k'>;
using continue_text = keyword<'c','o','n','t','i','n','u','e'>;
using switch_text = keyword<'s','w','i','t','c','h'>;
using case_text = keyword<'c','a','s','e'>;
using default_text = keyword<'d','e','f','a','u','l','t'>;
using module_text = keyword<'m','o','d','u','l','e'>;
using namespace_text = keyword<'n','a','m','e','s','p','a','c','e'>;
using defer_text = keyword<'d','e','f','e','r'>;
using true_text = keyword<'t','r','u','e'>;
using false_text = keyword<'f','a','l','s','e'>;
using as_text = keyword<'a','s'>;

struct reserved_word : sor< let_text, const_text, fn_text, type_text, struct_text, enum_text, import_text, from_text,
    export_text, if_text, else_text, while_text, for_text, in_text, loop_text, return_text, break_text, continue_text,
    switch_text, case_text, default_text, module_text, namespace_text, defer_text, true_text, false_text, as_text > {};

struct k_let : let_text, node<sym::kw_let> {};
struct k_const : const_text, node<sym::kw_const> {};
struct k_fn : fn_text, node<sym::kw_fn> {};
struct k_type : type_text, node<sym::kw_type> {};
struct k_struct : struct_text, node<sym::kw_struct> {};
struct k_enum : enum_text, node<sym::kw_enum> {};
struct k_import : import_text, node<sym::kw_import> {};
struct k_from : from_text, node<sym::kw_from> {};
struct k_export : export_text, node<sym::kw_export> {};
struct k_if : if_text, node<sym::kw_if> {};
struct k_else : else_text, node<sym::kw_else> {};
struct k_while : while_text, node<sym::kw_while> {};
struct k_for : for_text, node<sym::kw_for> {};
struct k_in : in_text, node<sym::kw_in> {};
struct k_loop : loop_text, node<sym::kw_loop> {};
struct k_return : return_text, node<sym::kw_return> {};
struct k_break : break_text, node<sym::kw_break> {};
struct k_continue : continue_text, node<sym::kw_continue> {};
struct k_switch : switch_text, node<sym::kw_switch> {};
struct k_case : case_text, node<sym::kw_case> {};
struct k_default : default_text, node<sym::kw_default> {};
struct k_module : module_text, node<sym::kw_module> {};
struct k_namespace : namespace_text, node<sym::kw_namespace> {};
struct k_defer : defer_text, node<sym::kw_defer> {};
struct k_true : true_text, node<sym::kw_true> {};
struct k_false : false_text, node<sym::kw_false> {};
struct k_as : as_text, node<sym::kw_as> {};

struct k_int : keyword<'i','n','t'>, node<sym::kw_int> {};
struct k_float : keyword<'f','l','o','a','t'>, node<sym::kw_float> {};
struct k_bool : keyword<'b','o','o','l'>, node<sym::kw_bool> {};
struct k_char : keyword<'c','h','a','r'>, node<sym::kw_char> {};
struct k_string : keyword<'s','t','r','i','n','g'>, node<sym::kw_string> {};
struct k_void : keyword<'v','o','i','d'>, node<sym::kw_void> {};

// ---------------------------------------------------------------------------
// Punctuation and operators
struct p_at : one<'@'>, node<sym::at_sign> {};
struct p_semicolon : one<';'>, node<sym::semicolon> {};
struct p_lparen : one<'('>, node<sym::lparen> {};
struct p_rparen : one<')'>, node<sym::rparen> {};
struct p_comma : one<','>, node<sym::comma> {};
struct p_colon : seq< one<':'>, not_at< one<':'> > >, node<sym::colon> {};
struct p_double_colon : two<':'>, node<sym::double_colon> {};
struct p_equals : seq< one<'='>, not_at< one<'='> > >, node<sym::equals> {};
struct p_lbrace : one<'{'>, node<sym::lbrace> {};
struct p_rbrace : one<'}'>, node<sym::rbrace> {};
struct p_lbracket : one<'['>, node<sym::lbracket> {};
struct p_rbracket : one<']'>, node<sym::rbracket> {};
struct p_lt : one<'<'>, node<sym::lt> {};
struct p_gt : one<'>'>, node<sym::gt> {};
struct p_star : one<'*'>, node<sym::star> {};
struct p_dot : one<'.'>, node<sym::dot> {};
struct p_plus : one<'+'>, node<sym::plus> {};
struct p_minus : one<'-'>, node<sym::minus> {};
struct p_slash : one<'/'>, node<sym::slash> {};
struct p_percent : one<'%'>, node<sym::percent> {};
struct p_eq_eq : string<'=','='>, node<sym::eq_eq> {};
struct p_not_eq : string<'!','='>, node<sym::not_eq_> {};
struct p_lt_eq : string<'<','='>, node<sym::lt_eq> {};
struct p_gt_eq : string<'>','='>, node<sym::gt_eq> {};
struct p_and_and : string<'&','&'>, node<sym::and_and> {};
struct p_or_or : string<'|','|'>, node<sym::or_or> {};
struct p_plus_eq : string<'+','='>, node<sym::plus_eq> {};
struct p_minus_eq : string<'-','='>, node<sym::minus_eq> {};
struct p_star_eq : string<'*','='>, node<sym::star_eq> {};
struct p_slash_eq : string<'/','='>, node<sym::slash_eq> {};
struct p_percent_eq : string<'%','='>, node<sym::percent_eq> {};
struct p_bang : seq< one<'!'>, not_at< one<'='> > >, node<sym::bang> {};
struct p_amp : seq< one<'&'>, not_at< one<'&'> > >, node<sym::amp> {};
struct p_dquote : one<'"'>, node<sym::dquote> {};
struct p_squote : one<'\''>, node<sym::squote> {};
struct p_backslash : one<'\\'>, node<sym::backslash> {};

// ---------------------------------------------------------------------------
// Lexical atoms
struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};
struct identifier_text : seq< ident_first, star< ident_rest > > {};
struct identifier : seq< not_at< reserved_word >, identifier_text >, node<sym::identifier> {};
// Where no keyword can start, any word is a name: `let from = 1;`, `a.type`.
struct name : identifier_text, node<sym::identifier> {};

struct number_fraction : seq< one<'.'>, plus< digit > > {};
struct number : seq< plus< digit >, opt< number_fraction > >, node<sym::number> {};

struct escape_char : utf8::not_one<'\n'> {};
struct escape_sequence : seq< p_backslash, escape_char >, node<sym::escape_sequence> {};
struct string_chunk : plus< not_one<'"','\\'> > {};
struct string_literal : seq< p_dquote, star< sor< escape_sequence, string_chunk > >, p_dquote >, node<sym::string> {};
struct char_body : sor< escape_sequence, utf8::not_one<'\'','\\'> > {};
struct char_literal : seq< p_squote, char_body, p_squote >, node<sym::char_literal> {};
struct boolean : sor< k_true, k_false >, node<sym::boolean> {};

struct primitive_type : sor< k_int, k_float, k_bool, k_char, k_string, k_void >, node<sym::primitive_type> {};

// ---------------------------------------------------------------------------
// Types
struct expression;
struct type;
struct block;

struct pointer_type_head : seq< tok< p_star >, type > {};
struct type_head : sor< pointer_type_head, tok< primitive_type >, tok< identifier > > {};
struct array_type_suffix : seq< tok< p_lbracket >, expression, tok< p_rbracket > > {};
struct comma_type : seq< tok< p_comma >, type > {};
struct generic_type_suffix : seq< tok< p_lt >, type, star< comma_type >, tok< p_gt > > {};
struct type_suffix : sor< array_type_suffix, generic_type_suffix > {};
struct type : seq< type_head, star< type_suffix > >, node<sym::type> {
    static void reshape(luma::SyntaxNode& n){ fold_type(n); }
};

struct type_annotation : seq< tok< p_colon >, type > {};

// ---------------------------------------------------------------------------
// Parameters
struct parameter : seq< tok< name >, tok< p_colon >, type >, node<sym::parameter> {};
struct comma_parameter : seq< tok< p_comma >, parameter > {};
struct parameter_items : seq< parameter, star< comma_parameter > > {};
struct parameter_list : seq< tok< p_lparen >, opt< parameter_items >, tok< p_rparen > >, node<sym::parameter_list> {};

// ---------------------------------------------------------------------------
// Expressions
struct comma_expression : seq< tok< p_comma >, expression > {};
struct expression_list : seq< expression, star< comma_expression > > {};
struct argument_list : seq< tok< p_lparen >, opt< expression_list >, tok< p_rparen > >, node<sym::argument_list> {};

struct qualified_identifier : seq< tok< identifier >, tok< p_double_colon >, tok< identifier > >, node<sym::qualified_identifier> {};
struct callee : sor< qualified_identifier, tok< identifier > > {};
struct call_expression : seq< callee, argument_list >, node<sym::call_expression> {};
struct parenthesized_expression : seq< tok< p_lparen >, expression, tok< p_rparen > >, node<sym::parenthesized_expression> {};
struct array_literal : seq< tok< p_lbracket >, opt< expression_list >, tok< p_rbracket > >, node<sym::array_literal> {};
struct literal : sor< tok< number >, tok< string_literal >, tok< char_literal >, tok< boolean >, array_literal >, node<sym::literal> {};

struct function_return : sor< type_annotation, type > {};
struct function_expression : seq< tok< k_fn >, parameter_list, opt< function_return >, block >, node<sym::function_expression> {};

struct primary_expression : sor< function_expression, call_expression, parenthesized_expression, literal, tok< identifier > > {};

struct member_suffix : seq< tok< p_dot >, tok< name > > {};
struct cast_suffix : seq< tok< k_as >, type > {};
struct postfix_suffix : sor< member_suffix, cast_suffix > {};
struct postfix_chain : seq< primary_expression, star< postfix_suffix > > {};

struct operand;
struct unary_operator : sor< p_bang, p_minus, p_star, p_amp > {};
struct unary_expression : seq< tok< unary_operator >, operand >, node<sym::unary_expression> {};

// Yields one `expression` per operand; member and cast suffixes are folded left to right.
struct operand : sor< unary_expression, postfix_chain >, node<sym::expression> {
    static void reshape(luma::SyntaxNode& n){ fold_postfix(n); }
};

// Longest operators first.
struct binary_operator : sor< p_eq_eq, p_not_eq, p_lt_eq, p_gt_eq, p_and_and, p_or_or,
    p_plus_eq, p_minus_eq, p_star_eq, p_slash_eq, p_percent_eq,
    p_plus, p_minus, p_star, p_slash, p_percent, p_lt, p_gt, p_equals > {};
struct binary_tail : seq< tok< binary_operator >, operand > {};

// All binary operators share one level and associate to the left.
struct expression : seq< operand, star< binary_tail > >, node<sym::expression> {
    static void reshape(luma::SyntaxNode& n){ fold_binary(n); }
};

// ---------------------------------------------------------------------------
// Statement terminators
struct semicolon_missing : at< skip_text, sor< one<'}'>, eof > >, missing_node<sym::semicolon> {};
struct terminator : sor< tok< p_semicolon >, semicolon_missing > {};
struct optional_semicolon : opt< tok< p_semicolon > > {};

// ---------------------------------------------------------------------------
// Statements
struct statement;

struct attribute_arg_list : seq< tok< p_lparen >, opt< expression_list >, tok< p_rparen > > {};
struct attribute_args : sor< tok< string_literal >, tok< identifier >, attribute_arg_list >, node<sym::attribute_args> {};
struct attribute_alias : seq< tok< k_as >, tok< name > > {};
struct attribute_statement : seq< tok< p_at >, tok< name >, attribute_args, opt< attribute_alias >, optional_semicolon >, node<sym::attribute_statement> {};

struct let_declaration : seq< tok< k_let >, tok< name >, opt< type_annotation >, tok< p_equals >, expression, terminator >, node<sym::let_declaration> {};
struct const_declaration : seq< tok< k_const >, tok< name >, opt< type_annotation >, tok< p_equals >, expression, optional_semicolon >, node<sym::const_declaration> {};
struct defer_statement : seq< tok< k_defer >, expression, terminator >, node<sym::defer_statement> {};

struct function_declaration : seq< tok< k_fn >, tok< name >, parameter_list, opt< type_annotation >, block >, node<sym::function_declaration> {};
struct type_declaration : seq< tok< k_type >, tok< name >, tok< p_equals >, type, terminator >, node<sym::type_declaration> {};

struct struct_field : seq< tok< name >, tok< p_colon >, type >, node<sym::struct_field> {};
struct comma_struct_field : seq< tok< p_comma >, struct_field > {};
struct struct_fields : seq< struct_field, star< comma_struct_field > > {};
struct struct_body : seq< tok< p_lbrace >, opt< struct_fields >, tok< p_rbrace > >, node<sym::struct_body> {};
struct struct_declaration : seq< tok< k_struct >, tok< name >, struct_body >, node<sym::struct_declaration> {};

struct enum_variant : tok< name >, node<sym::enum_variant> {};
struct comma_enum_variant : seq< tok< p_comma >, enum_variant > {};
struct enum_variants : seq< enum_variant, star< comma_enum_variant > > {};
struct enum_body : seq< tok< p_lbrace >, opt< enum_variants >, tok< p_rbrace > >, node<sym::enum_body> {};
struct enum_declaration : seq< tok< k_enum >, tok< name >, enum_body >, node<sym::enum_declaration> {};

struct import_source : seq< tok< k_from >, tok< string_literal > > {};
struct import_statement : seq< tok< k_import >, tok< name >, opt< import_source >, terminator >, node<sym::import_statement> {};
struct export_statement : seq< tok< k_export >, tok< name >, terminator >, node<sym::export_statement> {};

struct expression_statement : seq< expression, terminator >, node<sym::expression_statement> {};

struct else_clause : seq< tok< k_else >, block > {};
struct if_statement : seq< tok< k_if >, expression, block, opt< else_clause > >, node<sym::if_statement> {};
struct while_statement : seq< tok< k_while >, expression, block >, node<sym::while_statement> {};
struct for_statement : seq< tok< k_for >, tok< name >, tok< k_in >, expression, block >, node<sym::for_statement> {};
struct loop_statement : seq< tok< k_loop >, block >, node<sym::loop_statement> {};
struct return_statement : seq< tok< k_return >, opt< expression >, terminator >, node<sym::return_statement> {};
struct break_statement : seq< tok< k_break >, terminator >, node<sym::break_statement> {};
struct continue_statement : seq< tok< k_continue >, terminator >, node<sym::continue_statement> {};

struct switch_case : seq< tok< k_case >, expression, tok< p_colon >, block >, node<sym::switch_case> {};
struct switch_default : seq< tok< k_default >, tok< p_colon >, block >, node<sym::switch_default> {};
struct switch_statement : seq< tok< k_switch >, expression, tok< p_lbrace >, star< switch_case >, opt< switch_default >, tok< p_rbrace > >, node<sym::switch_statement> {};

struct control_statement : sor< if_statement, while_statement, for_statement, loop_statement, return_statement,
    break_statement, continue_statement >, node<sym::control_statement> {};

struct module_declaration : seq< tok< k_module >, tok< name >, block >, node<sym::module_declaration> {};
struct namespace_declaration : seq< tok< k_namespace >, tok< name >, block >, node<sym::namespace_declaration> {};

struct statement : sor< attribute_statement, let_declaration, const_declaration, defer_statement, function_declaration,
    type_declaration, struct_declaration, enum_declaration, import_statement, export_statement, control_statement,
    switch_statement, module_declaration, namespace_declaration, expression_statement >, node<sym::statement> {};

// ---------------------------------------------------------------------------
// Error recovery: unparseable text up to the next ';' or balanced {...} becomes an ERROR node.
// Names and numbers in the skipped run are kept as children of the ERROR node.
struct recover_string : seq< one<'"'>, star< sor< seq< one<'\\'>, any >, not_one<'"','\\'> > >, opt< one<'"'> > > {};
struct recover_group : seq< one<'{'>, star< sor< recover_group, recover_string, comment_text, not_one<'}'> > >, opt< one<'}'> > >, depth_guard {};
struct recover_word : sor< reserved_word, identifier > {};
struct recover_atom : sor< recover_string, comment_text, recover_word, number, not_one<';','{','}'> > {};
struct recover_run : seq< plus< recover_atom >, opt< sor< one<';'>, recover_group > > > {};
struct recover_text : sor< recover_run, one<';'>, recover_group > {};

struct statement_error : recover_text, node<luma::kErrorSymbol> {};
struct statement_recovery : seq< skip, not_at< one<'}'> >, not_at< eof >, statement_error > {};
struct block_item : sor< statement, statement_recovery > {};

struct rbrace_missing : at< skip_text, eof >, missing_node<sym::rbrace> {};
struct block_close : sor< tok< p_rbrace >, rbrace_missing > {};
struct block : seq< tok< p_lbrace >, star< block_item >, block_close >, node<sym::block> {};

// A stray '}' at top level is an error of its own.
struct top_error : sor< recover_text, one<'}'> >, node<luma::kErrorSymbol> {};
struct top_recovery : seq< skip, not_at< eof >, top_error > {};
struct top_item : sor< statement, top_recovery > {};

struct source_file : seq< star< top_item >, skip, eof >, node<sym::source_file> {};

} // namespace luma::lang::pegtl_front::grammar
