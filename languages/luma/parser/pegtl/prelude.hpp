#pragma once
#include <type_traits>

#include "../symbols.hpp"
#include "luma/tree_builder.hpp"

namespace luma::lang::pegtl_front {

// Tags mixed into grammar rules to say which tree node a successful match produces.
// Rules without a tag are transparent: their nodes land in the enclosing node.
template<luma::Symbol S>
struct node {
    static constexpr luma::Symbol node_symbol = S;
    static constexpr bool node_extra = false;
    static constexpr bool node_missing = false;
};

// Comments: may appear between any two tokens.
template<luma::Symbol S>
struct extra_node : node<S> {
    static constexpr bool node_extra = true;
};

// Zero-width token inserted by error recovery.
template<luma::Symbol S>
struct missing_node : node<S> {
    static constexpr bool node_missing = true;
};

// Recursive rule without a node: each level still counts toward max_depth.
struct depth_guard {
    static constexpr bool guards_depth = true;
};

template<typename Rule, typename = void>
struct is_node : std::false_type {};
template<typename Rule>
struct is_node<Rule, std::void_t<decltype(Rule::node_symbol)>> : std::true_type {};

template<typename Rule, typename = void>
struct is_guarded : std::false_type {};
template<typename Rule>
struct is_guarded<Rule, std::void_t<decltype(Rule::guards_depth)>> : std::true_type {};

template<typename Rule, typename = void>
struct has_reshape : std::false_type {};
template<typename Rule>
struct has_reshape<Rule, std::void_t<decltype(&Rule::reshape)>> : std::true_type {};

// Post-match rewrites turning flat operator/suffix chains into the nested
// left-associative shape (reshape.cpp).
void fold_binary(luma::SyntaxNode& n);
void fold_postfix(luma::SyntaxNode& n);
void fold_type(luma::SyntaxNode& n);

} // namespace luma::lang::pegtl_front
