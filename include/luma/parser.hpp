#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "luma/errors.hpp"
#include "luma/language.hpp"
#include "luma/tree.hpp"

namespace luma {

// Upper bound for max_depth; deeper settings are clamped. Grammar recursion
// grows the native stack with every open node.
inline constexpr std::uint32_t kMaxDepthLimit = 1024;
inline constexpr std::uint32_t kDefaultMaxDepth = kMaxDepthLimit;

struct ParseOptions {
    bool debug = false;  // [dbg] trace on stderr
    bool strict = false; // parse() throws if the tree contains ERROR/MISSING nodes
    std::uint32_t max_depth = kDefaultMaxDepth; // 1..kMaxDepthLimit
};

// Diagnostic codes:
//   E0001 unexpected input (ERROR node)
//   E0002 missing token (MISSING node)
//   E0003 nesting too deep
//   E0004 input too large
struct Diagnostic {
    std::string code;
    std::string message;
    std::string hint;
    int line{-1};
    int col{-1};
    std::uint32_t start_byte{0};
    std::uint32_t end_byte{0};
};

struct ParseResult {
    bool success{false};
    std::string filename;
    Tree tree; // empty when parsing could not produce a tree at all
    std::vector<Diagnostic> diagnostics;
};

class Parser {
public:
    Parser();
    explicit Parser(Language language);

    void set_language(Language language) { language_ = language; }
    const std::optional<Language>& language() const { return language_; }

    void set_options(const ParseOptions& options) { options_ = options; }
    const ParseOptions& options() const { return options_; }

    // Parses `source` into a tree. Syntax errors are represented in the tree
    // (ERROR / MISSING nodes) unless options().strict is set.
    Tree parse(std::string_view source, std::string_view filename = "<memory>") const;

    // Like parse(), but reports every problem as a Diagnostic instead of throwing.
    ParseResult parse_string(std::string_view source, std::string_view filename = "<memory>") const;

private:
    const Language& require_language() const;
    Tree build_tree(std::string_view source, std::string_view filename) const;

    std::optional<Language> language_;
    ParseOptions options_;
};

// Collects E0001/E0002 diagnostics for every ERROR and MISSING node under `root`.
std::vector<Diagnostic> collect_diagnostics(const Node& root);

} // namespace luma
