#include "prelude.hpp"

namespace luma::lang::pegtl_front {

using NodeList = std::vector<std::unique_ptr<luma::SyntaxNode>>;
using luma::build::make_node;
using luma::build::take_leading_extras;

namespace {

NodeList single(std::unique_ptr<luma::SyntaxNode> n){
    NodeList out;
    out.push_back(std::move(n));
    return out;
}

// Moves extras starting at kids[i] into out.
void move_extras(NodeList& kids, std::size_t& i, NodeList& out){
    while(i < kids.size() && kids[i]->extra) out.push_back(std::move(kids[i++]));
}

// Replaces n's children with lead followed by the children of body.
void install(luma::SyntaxNode& n, NodeList lead, std::unique_ptr<luma::SyntaxNode> body){
    NodeList out = std::move(lead);
    for(auto& c : body->children) out.push_back(std::move(c));
    n.children = std::move(out);
}

void restore(luma::SyntaxNode& n, NodeList lead){
    if(lead.empty()) return;
    for(auto& c : n.children) lead.push_back(std::move(c));
    n.children = std::move(lead);
}

} // namespace

// operand (op operand)*  ->  (expression (binary_expression (expression ...) op operand))
void fold_binary(luma::SyntaxNode& n){
    auto& kids = n.children;
    NodeList lead = take_leading_extras(kids);
    if(kids.empty()){ restore(n, std::move(lead)); return; }

    if(kids.size() == 1){
        // A lone operand is already an `expression`; splice its children in.
        auto only = std::move(kids[0]);
        kids.clear();
        if(only->symbol == sym::expression) install(n, std::move(lead), std::move(only));
        else { kids.push_back(std::move(only)); restore(n, std::move(lead)); }
        return;
    }

    std::unique_ptr<luma::SyntaxNode> acc = std::move(kids[0]);
    std::size_t i = 1;
    NodeList trailing;
    while(i < kids.size()){
        NodeList group = single(std::move(acc));
        move_extras(kids, i, group);
        if(i >= kids.size()){
            // Dangling extras: keep them after the folded expression.
            acc = std::move(group[0]);
            for(std::size_t k = 1; k < group.size(); ++k) trailing.push_back(std::move(group[k]));
            break;
        }
        group.push_back(std::move(kids[i++])); // operator
        move_extras(kids, i, group);
        if(i < kids.size()) group.push_back(std::move(kids[i++])); // right operand
        acc = make_node(sym::expression, single(make_node(sym::binary_expression, std::move(group))));
    }
    kids.clear();
    if(acc->symbol == sym::expression) install(n, std::move(lead), std::move(acc));
    else { kids.push_back(std::move(acc)); restore(n, std::move(lead)); }
    for(auto& t : trailing) n.children.push_back(std::move(t));
}

// primary ('.' identifier | 'as' type)*  ->  nested member/cast expressions
void fold_postfix(luma::SyntaxNode& n){
    auto& kids = n.children;
    NodeList lead = take_leading_extras(kids);
    if(kids.size() < 2 || kids[0]->symbol == sym::unary_expression){ restore(n, std::move(lead)); return; }

    auto acc = make_node(sym::expression, single(std::move(kids[0])));
    std::size_t i = 1;
    NodeList trailing;
    while(i < kids.size()){
        NodeList group = single(std::move(acc));
        move_extras(kids, i, group);
        if(i >= kids.size()){
            acc = std::move(group[0]);
            for(std::size_t k = 1; k < group.size(); ++k) trailing.push_back(std::move(group[k]));
            break;
        }
        const luma::Symbol op = kids[i]->symbol;
        group.push_back(std::move(kids[i++]));
        move_extras(kids, i, group);
        if(i < kids.size()) group.push_back(std::move(kids[i++]));
        const luma::Symbol kind = op == sym::dot ? sym::member_expression : sym::cast_expression;
        acc = make_node(sym::expression, single(make_node(kind, std::move(group))));
    }
    kids.clear();
    install(n, std::move(lead), std::move(acc));
    for(auto& t : trailing) n.children.push_back(std::move(t));
}

// head ('[' expr ']' | '<' type, ... '>')*  ->  nested types, innermost first
void fold_type(luma::SyntaxNode& n){
    auto& kids = n.children;
    NodeList lead = take_leading_extras(kids);
    if(kids.empty()){ restore(n, std::move(lead)); return; }

    NodeList head;
    std::size_t i = 0;
    if(kids[0]->symbol == sym::star){
        head.push_back(std::move(kids[i++]));
        move_extras(kids, i, head);
        if(i < kids.size()) head.push_back(std::move(kids[i++])); // pointee type
    } else {
        head.push_back(std::move(kids[i++]));
    }
    if(i >= kids.size()){
        kids = std::move(head);
        restore(n, std::move(lead));
        return;
    }

    auto acc = make_node(sym::type, std::move(head));
    while(i < kids.size()){
        NodeList group = single(std::move(acc));
        while(i < kids.size()){
            const bool closes = !kids[i]->extra && (kids[i]->symbol == sym::rbracket || kids[i]->symbol == sym::gt);
            group.push_back(std::move(kids[i++]));
            if(closes) break;
        }
        acc = make_node(sym::type, std::move(group));
    }
    kids.clear();
    install(n, std::move(lead), std::move(acc));
}

} // namespace luma::lang::pegtl_front
