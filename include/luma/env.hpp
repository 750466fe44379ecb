#pragma once
#include <cstdlib>

#include "luma/parser.hpp"

namespace luma {

// True when the variable is set to 1/t/T/y/Y.
inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

// Reads LUMA_DEBUG_PARSE, LUMA_STRICT and LUMA_MAX_DEPTH.
ParseOptions detect_parse_options();

} // namespace luma
