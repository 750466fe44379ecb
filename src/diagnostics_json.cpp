#include "luma/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace luma {

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c : s){
        switch(c){
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string diagnostics_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")
      <<",\"file\":"<<json_escape(r.filename)
      <<",\"errors\":[";
    for(size_t i=0;i<r.diagnostics.size(); ++i){
        const auto &d=r.diagnostics[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<",\"start_byte\":"<<d.start_byte
            <<",\"end_byte\":"<<d.end_byte
            <<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const ParseResult& r){
    if(const char* env = std::getenv("LUMA_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=diagnostics_to_json(r);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace luma
