#include "luma/tree.hpp"
#include <algorithm>
#include <stdexcept>

namespace luma {

namespace detail {

TreeData::TreeData(Language lang, std::string src, std::unique_ptr<SyntaxNode> r)
    : language(lang), source(std::move(src)), root(std::move(r)) {
    line_starts.push_back(0);
    for(std::size_t i = 0; i < source.size(); ++i){
        if(source[i] == '\n') line_starts.push_back(static_cast<std::uint32_t>(i + 1));
    }
}

Point TreeData::point_at(std::uint32_t byte) const {
    auto it = std::upper_bound(line_starts.begin(), line_starts.end(), byte);
    auto row = static_cast<std::uint32_t>((it - line_starts.begin()) - 1);
    return Point{row, byte - line_starts[row]};
}

} // namespace detail

SyntaxNode::~SyntaxNode(){
    std::vector<std::unique_ptr<SyntaxNode>> pending = std::move(children);
    while(!pending.empty()){
        std::unique_ptr<SyntaxNode> n = std::move(pending.back());
        pending.pop_back();
        for(auto& c : n->children) pending.push_back(std::move(c));
        n->children.clear();
    }
}

static void append_quoted(std::string& out, std::string_view s){
    out += '"';
    for(char c : s){
        if(c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
}

std::string_view Node::type() const {
    if(!raw_) return std::string_view();
    return tree_->language.symbol_name(raw_->symbol);
}

bool Node::is_named() const { return raw_ && tree_->language.symbol_is_named(raw_->symbol); }

Point Node::start_point() const { return raw_ ? tree_->point_at(raw_->start_byte) : Point{}; }
Point Node::end_point() const { return raw_ ? tree_->point_at(raw_->end_byte) : Point{}; }
Range Node::range() const {
    if(!raw_) return Range{};
    return Range{start_point(), end_point(), raw_->start_byte, raw_->end_byte};
}

std::string_view Node::text() const {
    if(!raw_) return std::string_view();
    return std::string_view(tree_->source).substr(raw_->start_byte, raw_->end_byte - raw_->start_byte);
}

Node Node::child(std::uint32_t i) const {
    if(!raw_ || i >= raw_->children.size()) return Node();
    return Node(tree_, raw_->children[i].get());
}

std::uint32_t Node::named_child_count() const {
    if(!raw_) return 0;
    std::uint32_t n = 0;
    for(const auto& c : raw_->children) if(tree_->language.symbol_is_named(c->symbol)) ++n;
    return n;
}

Node Node::named_child(std::uint32_t i) const {
    if(!raw_) return Node();
    for(const auto& c : raw_->children){
        if(!tree_->language.symbol_is_named(c->symbol)) continue;
        if(i == 0) return Node(tree_, c.get());
        --i;
    }
    return Node();
}

std::vector<Node> Node::children() const {
    std::vector<Node> out;
    if(!raw_) return out;
    out.reserve(raw_->children.size());
    for(const auto& c : raw_->children) out.emplace_back(tree_, c.get());
    return out;
}

std::vector<Node> Node::named_children() const {
    std::vector<Node> out;
    if(!raw_) return out;
    for(const auto& c : raw_->children) if(tree_->language.symbol_is_named(c->symbol)) out.emplace_back(tree_, c.get());
    return out;
}

Node Node::child_by_type(std::string_view type) const {
    if(!raw_) return Node();
    for(const auto& c : raw_->children){
        if(tree_->language.symbol_name(c->symbol) == type) return Node(tree_, c.get());
    }
    return Node();
}

Node Node::parent() const {
    if(!raw_ || !raw_->parent) return Node();
    return Node(tree_, raw_->parent);
}

Node Node::next_sibling() const {
    if(!raw_) return Node();
    const SyntaxNode* p = raw_->parent;
    if(!p || raw_->index + 1 >= p->children.size()) return Node();
    return Node(tree_, p->children[raw_->index + 1].get());
}

Node Node::prev_sibling() const {
    if(!raw_) return Node();
    const SyntaxNode* p = raw_->parent;
    if(!p || raw_->index == 0) return Node();
    return Node(tree_, p->children[raw_->index - 1].get());
}

Node Node::next_named_sibling() const {
    for(Node n = next_sibling(); n; n = n.next_sibling()) if(n.is_named()) return n;
    return Node();
}

Node Node::prev_named_sibling() const {
    for(Node n = prev_sibling(); n; n = n.prev_sibling()) if(n.is_named()) return n;
    return Node();
}

Node Node::descend(std::uint32_t start, std::uint32_t end, bool named_only) const {
    if(!raw_) return Node();
    Node node = *this;
    Node last = *this;
    bool moved = true;
    while(moved){
        moved = false;
        for(const auto& c : node.raw_->children){
            if(c->end_byte < end || (c->end_byte == start && start < end)) continue;
            if(c->start_byte > start) break;
            node = Node(tree_, c.get());
            if(!named_only || node.is_named()) last = node;
            moved = true;
            break;
        }
    }
    return last;
}

Node Node::descendant_for_byte_range(std::uint32_t start, std::uint32_t end) const { return descend(start, end, false); }
Node Node::named_descendant_for_byte_range(std::uint32_t start, std::uint32_t end) const { return descend(start, end, true); }

std::size_t Node::descendant_count() const {
    if(!raw_) return 0;
    std::size_t n = 0;
    std::vector<const SyntaxNode*> stack{raw_};
    while(!stack.empty()){
        const SyntaxNode* cur = stack.back(); stack.pop_back();
        ++n;
        for(const auto& c : cur->children) stack.push_back(c.get());
    }
    return n;
}

// Writes a complete leaf form, or opens "(type" for a named node with children
// still to come; returns true when the node is finished.
bool Node::write_head(std::string& out) const {
    if(raw_->missing){
        out += "(MISSING ";
        if(is_named()) out += type(); else append_quoted(out, type());
        out += ')';
        return true;
    }
    if(!is_named()){
        out += '('; append_quoted(out, type()); out += ')';
        return true;
    }
    out += '(';
    out += type();
    return false;
}

void Node::write_sexp(std::string& out) const {
    if(write_head(out)) return;
    struct Frame { const SyntaxNode* node; std::size_t next; };
    std::vector<Frame> stack{Frame{raw_, 0}};
    while(!stack.empty()){
        const SyntaxNode* parent = stack.back().node;
        if(stack.back().next == parent->children.size()){
            out += ')';
            stack.pop_back();
            continue;
        }
        Node child(tree_, parent->children[stack.back().next++].get());
        if(!child.is_missing() && !child.is_named()) continue;
        out += ' ';
        if(!child.write_head(out)) stack.push_back(Frame{child.raw_, 0});
    }
}

std::string Node::to_sexp() const {
    if(!raw_) return std::string();
    std::string out;
    write_sexp(out);
    return out;
}

Tree::Tree(Language language, std::string source, std::unique_ptr<SyntaxNode> root)
    : data_(std::make_shared<const detail::TreeData>(language, std::move(source), std::move(root))) {}

Node Tree::root_node() const {
    if(!data_) return Node();
    return Node(data_.get(), data_->root.get());
}

const Language& Tree::language() const {
    if(!data_) throw std::logic_error("empty tree has no language");
    return data_->language;
}

std::string_view Tree::source() const {
    if(!data_) return std::string_view();
    return data_->source;
}

Point Tree::point_at(std::uint32_t byte) const {
    if(!data_) return Point{};
    return data_->point_at(byte);
}

bool TreeCursor::goto_first_child(){
    Node c = current_.child(0);
    if(!c) return false;
    current_ = c; ++depth_;
    return true;
}

bool TreeCursor::goto_next_sibling(){
    if(current_ == root_) return false;
    Node s = current_.next_sibling();
    if(!s) return false;
    current_ = s;
    return true;
}

bool TreeCursor::goto_parent(){
    if(current_ == root_) return false;
    current_ = current_.parent(); --depth_;
    return true;
}

long TreeCursor::goto_first_child_for_byte(std::uint32_t byte){
    std::uint32_t n = current_.child_count();
    for(std::uint32_t i = 0; i < n; ++i){
        Node c = current_.child(i);
        if(c.end_byte() > byte){
            current_ = c; ++depth_;
            return static_cast<long>(i);
        }
    }
    return -1;
}

void TreeCursor::reset(Node start){
    root_ = start; current_ = start; depth_ = 0;
}

} // namespace luma
