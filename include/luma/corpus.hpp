#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "luma/parser.hpp"

namespace luma {

// One golden case from a corpus file:
//
//   ==========
//   case name
//   ==========
//   source text
//   ---
//   (expected (sexp))
struct CorpusCase {
    std::string name;
    std::string source;
    std::string expected;
    int line{0}; // 1-based line of the opening header
};

struct CorpusOutcome {
    bool passed{false};
    std::string actual;   // normalized
    std::string expected; // normalized
};

// Throws CorpusError on a header without a matching '---' separator.
std::vector<CorpusCase> parse_corpus(std::string_view text);

// Collapses whitespace runs to one space and drops spaces next to parentheses.
std::string normalize_sexp(std::string_view sexp);

CorpusOutcome run_corpus_case(const Parser& parser, const CorpusCase& c);

} // namespace luma
