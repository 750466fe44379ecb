// diagnostics_json.hpp - JSON serialization for ParseResult diagnostics
#pragma once
#include "luma/parser.hpp"
#include <string>

namespace luma {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const ParseResult& r);

// If LUMA_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ParseResult& r);

} // namespace luma
