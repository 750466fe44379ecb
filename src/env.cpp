#include "luma/env.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace luma {

// Reads process env vars and constructs ParseOptions.
// Note: Parser() calls this once; later changes to the environment need set_options().
ParseOptions detect_parse_options(){
    ParseOptions o{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    o.debug = flag_enabled("LUMA_DEBUG_PARSE");
    o.strict = flag_enabled("LUMA_STRICT");

    if(const char* v = get("LUMA_MAX_DEPTH")){
        errno = 0;
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if(errno == 0 && end && *end == '\0' && n > 0 && n <= kMaxDepthLimit){
            o.max_depth = static_cast<std::uint32_t>(n);
        } else {
            std::fprintf(stderr, "[dbg][luma][env] ignoring invalid LUMA_MAX_DEPTH='%s'\n", v);
        }
    }
    return o;
}

} // namespace luma
