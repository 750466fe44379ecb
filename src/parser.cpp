#include "luma/parser.hpp"
#include "luma/diagnostics_json.hpp"
#include "luma/env.hpp"
#include "luma/tree_builder.hpp"
#include <algorithm>
#include <cstdio>
#include <limits>

namespace luma {

Parser::Parser() : options_(detect_parse_options()) {}

Parser::Parser(Language language) : language_(language), options_(detect_parse_options()) {}

const Language& Parser::require_language() const {
    if(!language_) throw ParseError("parser has no language");
    return *language_;
}

Tree Parser::build_tree(std::string_view source, std::string_view filename) const {
    const Language& lang = require_language();
    if(source.size() > std::numeric_limits<std::uint32_t>::max()) throw ParseError("input too large");
    TreeBuilder builder(source, std::min(options_.max_depth, kMaxDepthLimit));
    lang.def()->parse(source, filename, builder);
    auto root = builder.finish();
    return Tree(lang, std::string(source), std::move(root));
}

static std::string snippet(std::string_view text){
    std::size_t nl = text.find('\n');
    std::string_view first = text.substr(0, nl);
    if(first.size() > 24) return std::string(first.substr(0, 24)) + "...";
    return std::string(first);
}

std::vector<Diagnostic> collect_diagnostics(const Node& root){
    std::vector<Diagnostic> out;
    if(!root || !root.has_error()) return out;
    std::vector<Node> stack{root};
    while(!stack.empty()){
        Node n = stack.back(); stack.pop_back();
        if(!n.has_error()) continue;
        Point p = n.start_point();
        if(n.is_error()){
            out.push_back(Diagnostic{"E0001", "unexpected '" + snippet(n.text()) + "'", "expected a statement",
                                     static_cast<int>(p.row) + 1, static_cast<int>(p.column) + 1, n.start_byte(), n.end_byte()});
            continue;
        }
        if(n.is_missing()){
            std::string what(n.type());
            std::string msg = n.is_named() ? "missing " + what : "missing '" + what + "'";
            out.push_back(Diagnostic{"E0002", msg, "insert " + (n.is_named() ? what : "'" + what + "'"),
                                     static_cast<int>(p.row) + 1, static_cast<int>(p.column) + 1, n.start_byte(), n.end_byte()});
            continue;
        }
        for(std::uint32_t i = n.child_count(); i-- > 0;) stack.push_back(n.child(i));
    }
    return out;
}

Tree Parser::parse(std::string_view source, std::string_view filename) const {
    Tree tree = build_tree(source, filename);
    Node root = tree.root_node();
    if(options_.debug){
        std::fprintf(stderr, "[dbg][luma][parse] file=%.*s bytes=%zu nodes=%zu has_error=%d\n",
                     static_cast<int>(filename.size()), filename.data(), source.size(), root.descendant_count(), root.has_error() ? 1 : 0);
    }
    if(options_.strict && root.has_error()){
        auto diags = collect_diagnostics(root);
        const Diagnostic& d = diags.front();
        throw ParseError(std::string(filename) + ":" + std::to_string(d.line) + ":" + std::to_string(d.col) + ": " + d.message, d.line, d.col);
    }
    return tree;
}

ParseResult Parser::parse_string(std::string_view source, std::string_view filename) const {
    require_language();
    ParseResult r;
    r.filename = std::string(filename);
    if(source.size() > std::numeric_limits<std::uint32_t>::max()){
        r.diagnostics.push_back(Diagnostic{"E0004", "input too large", "split the source into smaller files", 1, 1, 0, 0});
        maybe_print_json(r);
        return r;
    }
    try {
        r.tree = build_tree(source, filename);
    } catch(const NestingError& e){
        r.diagnostics.push_back(Diagnostic{"E0003", e.what(), "reduce nesting", e.line, e.col, 0, 0});
        if(options_.debug) std::fprintf(stderr, "[dbg][luma][parse] %s\n", e.what());
        maybe_print_json(r);
        return r;
    }
    r.diagnostics = collect_diagnostics(r.tree.root_node());
    r.success = r.diagnostics.empty();
    if(options_.debug){
        std::fprintf(stderr, "[dbg][luma][parse] file=%s bytes=%zu nodes=%zu diagnostics=%zu\n",
                     r.filename.c_str(), source.size(), r.tree.root_node().descendant_count(), r.diagnostics.size());
        for(const auto& d : r.diagnostics){
            std::fprintf(stderr, "[dbg][luma][parse] %s %d:%d %s\n", d.code.c_str(), d.line, d.col, d.message.c_str());
        }
    }
    maybe_print_json(r);
    return r;
}

} // namespace luma
