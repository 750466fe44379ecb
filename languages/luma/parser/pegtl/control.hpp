#pragma once
#include "prelude.hpp"
#include <tao/pegtl.hpp>

namespace luma::lang::pegtl_front {

// PEGTL control that mirrors rule start/success/failure into a TreeBuilder.
template<typename Rule>
struct tree_control : tao::pegtl::normal<Rule> {
    template<typename ParseInput>
    static void start(const ParseInput& in, luma::TreeBuilder& b){
        if constexpr(is_guarded<Rule>::value) b.push_guard(b.offset(in.current()));
        if constexpr(is_node<Rule>::value) b.open(Rule::node_symbol, b.offset(in.current()), Rule::node_extra, Rule::node_missing);
        else b.enter();
    }

    template<typename ParseInput>
    static void success(const ParseInput& in, luma::TreeBuilder& b){
        if constexpr(is_node<Rule>::value){
            if constexpr(has_reshape<Rule>::value) Rule::reshape(b.current());
            b.close(b.offset(in.current()));
        } else {
            b.leave();
        }
        if constexpr(is_guarded<Rule>::value) b.pop_guard();
    }

    template<typename ParseInput>
    static void failure(const ParseInput&, luma::TreeBuilder& b){
        if constexpr(is_node<Rule>::value) b.discard();
        else b.rewind();
        if constexpr(is_guarded<Rule>::value) b.pop_guard();
    }
};

} // namespace luma::lang::pegtl_front
