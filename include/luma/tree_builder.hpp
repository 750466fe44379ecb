#pragma once
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "luma/tree.hpp"

namespace luma {

// Incremental tree assembly driven by a grammar's rule callbacks.
//
// Node rules bracket their match with open()/close() (or discard() on failure).
// Every other rule brackets its match with enter()/leave() (or rewind() on failure),
// so nodes produced inside an alternative that later backtracks are dropped again.
class TreeBuilder {
public:
    TreeBuilder(std::string_view source, std::uint32_t max_depth);

    std::string_view source() const { return source_; }
    std::uint32_t offset(const char* at) const { return static_cast<std::uint32_t>(at - source_.data()); }

    // Throws NestingError once max_depth nodes are already open.
    void open(Symbol symbol, std::uint32_t start_byte, bool extra = false, bool missing = false);
    void close(std::uint32_t end_byte);
    void discard();

    void enter();
    void leave();
    void rewind();

    // Brackets a recursive rule that builds no node of its own, so that its
    // recursion counts toward max_depth as well. Throws NestingError.
    void push_guard(std::uint32_t at);
    void pop_guard() { --guards_; }

    // Node currently being built (innermost open()).
    SyntaxNode& current();
    std::size_t depth() const { return frames_.size() - 1 + guards_; }

    // Consumes the builder's state; throws ParseError unless exactly one root was produced.
    std::unique_ptr<SyntaxNode> finish();

private:
    [[noreturn]] void fail_nesting(std::uint32_t byte) const;

    std::string_view source_;
    std::uint32_t max_depth_;
    std::vector<std::unique_ptr<SyntaxNode>> frames_; // frames_[0] collects finished roots
    std::vector<std::size_t> marks_;
    std::size_t guards_{0};
};

// Shared helpers for grammar-side tree reshaping.
namespace build {

std::unique_ptr<SyntaxNode> make_node(Symbol symbol, std::vector<std::unique_ptr<SyntaxNode>> children);

// Splits leading extras off `children`, returning them.
std::vector<std::unique_ptr<SyntaxNode>> take_leading_extras(std::vector<std::unique_ptr<SyntaxNode>>& children);

} // namespace build

} // namespace luma
