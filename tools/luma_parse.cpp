#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "luma/diagnostics_json.hpp"
#include "luma/lang/luma.hpp"
#include "luma/parser.hpp"

static std::string read_file(const std::string& path){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) throw std::runtime_error("failed to open: " + path);
    std::stringstream ss; ss << ifs.rdbuf();
    return ss.str();
}

static int usage(){
    std::cerr << "usage: luma_parse [--json] [--quiet] <file.lx>\n";
    return 2;
}

// Exit codes: 0 clean parse, 1 syntax errors, 2 usage or I/O failure.
int main(int argc, char** argv){
    bool json = false, quiet = false;
    std::string path;
    for(int i = 1; i < argc; ++i){
        std::string a = argv[i];
        if(a == "--json") json = true;
        else if(a == "--quiet") quiet = true;
        else if(!a.empty() && a[0] == '-') return usage();
        else if(path.empty()) path = a;
        else return usage();
    }
    if(path.empty()) return usage();
    try {
        std::string src = read_file(path);
        luma::Parser parser(luma::Language(luma::lang::language()));
        auto res = parser.parse_string(src, path);
        if(json) std::cout << luma::diagnostics_to_json(res) << "\n";
        else if(!quiet && !res.tree.empty()) std::cout << res.tree.to_sexp() << "\n";
        if(!json){
            for(const auto& d : res.diagnostics)
                std::cerr << path << ":" << d.line << ":" << d.col << ": error[" << d.code << "]: " << d.message
                          << (d.hint.empty() ? "" : " (" + d.hint + ")") << "\n";
        }
        return res.success ? 0 : 1;
    } catch(const std::exception& e){
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
