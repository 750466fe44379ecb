#include "luma/tree_builder.hpp"
#include "luma/errors.hpp"
#include <string>

namespace luma {

TreeBuilder::TreeBuilder(std::string_view source, std::uint32_t max_depth)
    : source_(source), max_depth_(max_depth) {
    frames_.push_back(std::make_unique<SyntaxNode>());
}

void TreeBuilder::fail_nesting(std::uint32_t byte) const {
    int line = 1, col = 1;
    for(std::uint32_t i = 0; i < byte && i < source_.size(); ++i){
        if(source_[i] == '\n'){ ++line; col = 1; } else { ++col; }
    }
    throw NestingError("nesting exceeds maximum depth of " + std::to_string(max_depth_) + " at " +
                       std::to_string(line) + ":" + std::to_string(col), line, col);
}

void TreeBuilder::open(Symbol symbol, std::uint32_t start_byte, bool extra, bool missing){
    if(depth() >= max_depth_) fail_nesting(start_byte);
    auto n = std::make_unique<SyntaxNode>();
    n->symbol = symbol;
    n->start_byte = n->end_byte = start_byte;
    n->extra = extra;
    n->missing = missing;
    frames_.push_back(std::move(n));
}

void TreeBuilder::close(std::uint32_t end_byte){
    std::unique_ptr<SyntaxNode> n = std::move(frames_.back());
    frames_.pop_back();
    SyntaxNode& parent = *frames_.back();
    if(n->missing){
        n->end_byte = n->start_byte;
        parent.children.push_back(std::move(n));
        return;
    }
    n->end_byte = end_byte;
    if(!n->children.empty()){
        // Comments picked up before the node's first token belong to the enclosing node.
        if(frames_.size() > 1){
            for(auto& e : build::take_leading_extras(n->children)) parent.children.push_back(std::move(e));
        }
        // ERROR nodes also span recovered text that produced no child.
        if(n->symbol != kErrorSymbol) n->start_byte = n->children.empty() ? end_byte : n->children.front()->start_byte;
    }
    parent.children.push_back(std::move(n));
}

void TreeBuilder::discard(){
    frames_.pop_back();
}

void TreeBuilder::enter(){
    marks_.push_back(frames_.back()->children.size());
}

void TreeBuilder::leave(){
    marks_.pop_back();
}

void TreeBuilder::rewind(){
    std::size_t m = marks_.back();
    marks_.pop_back();
    auto& kids = frames_.back()->children;
    if(kids.size() > m) kids.erase(kids.begin() + static_cast<std::ptrdiff_t>(m), kids.end());
}

void TreeBuilder::push_guard(std::uint32_t at){
    if(depth() >= max_depth_) fail_nesting(at);
    ++guards_;
}

SyntaxNode& TreeBuilder::current(){
    return *frames_.back();
}

// Sets parent links and has_error flags. Iterative: trees may be deeper than the stack allows.
static void link(SyntaxNode& root){
    std::vector<SyntaxNode*> order{&root};
    for(std::size_t k = 0; k < order.size(); ++k){
        SyntaxNode& n = *order[k];
        for(std::size_t i = 0; i < n.children.size(); ++i){
            SyntaxNode& c = *n.children[i];
            c.parent = &n;
            c.index = static_cast<std::uint32_t>(i);
            order.push_back(&c);
        }
    }
    // Children come after their parent in `order`.
    for(std::size_t k = order.size(); k-- > 0;){
        SyntaxNode& n = *order[k];
        n.has_error = n.has_error || n.symbol == kErrorSymbol || n.missing;
        if(n.has_error && n.parent) n.parent->has_error = true;
    }
}

std::unique_ptr<SyntaxNode> TreeBuilder::finish(){
    if(frames_.size() != 1 || !marks_.empty()) throw ParseError("unbalanced tree construction");
    auto& roots = frames_.front()->children;
    if(roots.size() != 1) throw ParseError("grammar produced " + std::to_string(roots.size()) + " root nodes");
    std::unique_ptr<SyntaxNode> root = std::move(roots.front());
    roots.clear();
    root->start_byte = 0;
    root->end_byte = static_cast<std::uint32_t>(source_.size());
    link(*root);
    return root;
}

namespace build {

std::unique_ptr<SyntaxNode> make_node(Symbol symbol, std::vector<std::unique_ptr<SyntaxNode>> children){
    auto n = std::make_unique<SyntaxNode>();
    n->symbol = symbol;
    if(!children.empty()){
        n->start_byte = children.front()->start_byte;
        n->end_byte = children.back()->end_byte;
    }
    n->children = std::move(children);
    return n;
}

std::vector<std::unique_ptr<SyntaxNode>> take_leading_extras(std::vector<std::unique_ptr<SyntaxNode>>& children){
    std::size_t k = 0;
    while(k < children.size() && children[k]->extra) ++k;
    std::vector<std::unique_ptr<SyntaxNode>> out;
    out.reserve(k);
    for(std::size_t i = 0; i < k; ++i) out.push_back(std::move(children[i]));
    children.erase(children.begin(), children.begin() + static_cast<std::ptrdiff_t>(k));
    return out;
}

} // namespace build

} // namespace luma
