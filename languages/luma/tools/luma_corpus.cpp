#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "luma/corpus.hpp"
#include "luma/lang/luma.hpp"

static int usage(){
    std::cerr << "usage: luma_corpus (print|test) <corpus.txt>\n";
    return 2;
}

static std::string read_file(const std::string& path){
    std::ifstream ifs(path, std::ios::binary);
    if(!ifs) throw std::runtime_error("failed to open: " + path);
    std::ostringstream oss; oss << ifs.rdbuf();
    return oss.str();
}

int main(int argc, char** argv){
    try {
        if(argc < 3) return usage();
        std::string mode = argv[1];
        std::string input = argv[2];
        if(mode != "print" && mode != "test") return usage();
        auto cases = luma::parse_corpus(read_file(input));
        luma::Parser parser(luma::Language(luma::lang::language()));
        if(mode == "print"){
            for(const auto& c : cases){
                std::cout << "== " << c.name << "\n" << parser.parse(c.source, c.name).to_sexp() << "\n";
            }
            return 0;
        }
        int failed = 0;
        for(const auto& c : cases){
            auto r = luma::run_corpus_case(parser, c);
            if(r.passed) continue;
            ++failed;
            std::cerr << "Mismatch in '" << c.name << "' (" << input << ":" << c.line << ")\n";
            std::cerr << "--- expected ---\n" << r.expected << "\n--- actual ---\n" << r.actual << "\n";
        }
        std::cout << (cases.size() - failed) << "/" << cases.size() << " cases passed\n";
        return failed == 0 ? 0 : 1;
    } catch(const std::exception& ex){
        std::cerr << "error: " << ex.what() << "\n";
        return 1;
    }
}
