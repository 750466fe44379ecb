// Concrete syntax tree: owned node storage, Tree, Node handles and TreeCursor.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "luma/language.hpp"

namespace luma {

struct Point {
    std::uint32_t row{0};
    std::uint32_t column{0}; // byte column
};

inline bool operator==(const Point& a, const Point& b){ return a.row == b.row && a.column == b.column; }
inline bool operator!=(const Point& a, const Point& b){ return !(a == b); }

struct Range {
    Point start_point;
    Point end_point;
    std::uint32_t start_byte{0};
    std::uint32_t end_byte{0};
};

// Owned node storage. Built by TreeBuilder, immutable once a Tree holds it.
struct SyntaxNode {
    SyntaxNode() = default;
    SyntaxNode(const SyntaxNode&) = delete;
    SyntaxNode& operator=(const SyntaxNode&) = delete;
    ~SyntaxNode(); // releases descendants without recursing

    Symbol symbol{0};
    std::uint32_t start_byte{0};
    std::uint32_t end_byte{0};
    bool extra{false};
    bool missing{false};
    bool has_error{false};
    SyntaxNode* parent{nullptr};
    std::uint32_t index{0}; // position within parent->children
    std::vector<std::unique_ptr<SyntaxNode>> children;
};

namespace detail {
struct TreeData {
    TreeData(Language lang, std::string src, std::unique_ptr<SyntaxNode> r);
    Language language;
    std::string source;
    std::vector<std::uint32_t> line_starts;
    std::unique_ptr<SyntaxNode> root;
    Point point_at(std::uint32_t byte) const;
};
} // namespace detail

class Node {
public:
    Node() = default;
    Node(const detail::TreeData* tree, const SyntaxNode* raw) : tree_(tree), raw_(raw) {}

    bool is_null() const { return raw_ == nullptr; }
    explicit operator bool() const { return raw_ != nullptr; }

    // A null node answers every query with a null node, zero, false or an empty string.
    Symbol symbol() const { return raw_ ? raw_->symbol : Symbol{0}; }
    std::string_view type() const;
    bool is_named() const;
    bool is_extra() const { return raw_ && raw_->extra; }
    bool is_error() const { return raw_ && raw_->symbol == kErrorSymbol; }
    bool is_missing() const { return raw_ && raw_->missing; }
    bool has_error() const { return raw_ && raw_->has_error; }

    std::uint32_t start_byte() const { return raw_ ? raw_->start_byte : 0; }
    std::uint32_t end_byte() const { return raw_ ? raw_->end_byte : 0; }
    Point start_point() const;
    Point end_point() const;
    Range range() const;
    std::string_view text() const;

    std::uint32_t child_count() const { return raw_ ? static_cast<std::uint32_t>(raw_->children.size()) : 0; }
    Node child(std::uint32_t i) const;
    std::uint32_t named_child_count() const;
    Node named_child(std::uint32_t i) const;
    std::vector<Node> children() const;
    std::vector<Node> named_children() const;
    // First direct child of the given kind name, or a null node.
    Node child_by_type(std::string_view type) const;

    Node parent() const;
    Node next_sibling() const;
    Node prev_sibling() const;
    Node next_named_sibling() const;
    Node prev_named_sibling() const;

    // Smallest node spanning [start, end).
    Node descendant_for_byte_range(std::uint32_t start, std::uint32_t end) const;
    Node named_descendant_for_byte_range(std::uint32_t start, std::uint32_t end) const;
    // Number of nodes in this subtree, including this node.
    std::size_t descendant_count() const;

    std::string to_sexp() const;

    const SyntaxNode* raw() const { return raw_; }

    bool operator==(const Node& o) const { return raw_ == o.raw_; }
    bool operator!=(const Node& o) const { return raw_ != o.raw_; }

private:
    Node descend(std::uint32_t start, std::uint32_t end, bool named_only) const;
    bool write_head(std::string& out) const;
    void write_sexp(std::string& out) const;

    const detail::TreeData* tree_{nullptr};
    const SyntaxNode* raw_{nullptr};
};

// Immutable parse result. Copies share the same storage, so Node handles stay
// valid for as long as any copy is alive.
class Tree {
public:
    Tree() = default;
    Tree(Language language, std::string source, std::unique_ptr<SyntaxNode> root);

    bool empty() const { return !data_; }
    Node root_node() const;
    const Language& language() const;
    std::string_view source() const;
    Point point_at(std::uint32_t byte) const;
    std::string to_sexp() const { return root_node().to_sexp(); }

private:
    std::shared_ptr<const detail::TreeData> data_;
};

// Stateful walker over a subtree. Never moves above the node it was created on.
class TreeCursor {
public:
    explicit TreeCursor(Node start) : root_(start), current_(start) {}

    Node current_node() const { return current_; }
    std::uint32_t depth() const { return depth_; }

    bool goto_first_child();
    bool goto_next_sibling();
    bool goto_parent();
    // Moves to the first child that ends after `byte`; returns its index or -1.
    long goto_first_child_for_byte(std::uint32_t byte);
    void reset(Node start);

private:
    Node root_;
    Node current_;
    std::uint32_t depth_{0};
};

} // namespace luma
