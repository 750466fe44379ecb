#include "luma/lang/luma.hpp"
#include "luma/parser.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; std::size_t nodes; bool has_error; };

static RunResult bench_case(const luma::Parser& parser, const std::string& program, int reps){
    std::size_t nodes = 0;
    bool has_error = false;
    auto t0 = Clock::now();
    for(int i = 0; i < reps; ++i){
        auto tree = parser.parse(program, "<bench>");
        nodes = tree.root_node().descendant_count();
        has_error = tree.root_node().has_error();
    }
    auto t1 = Clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count() / reps;
    return { ms, nodes, has_error };
}

static std::string repeat(const std::string& unit, int n){
    std::string out;
    out.reserve(unit.size() * static_cast<std::size_t>(n));
    for(int i = 0; i < n; ++i) out += unit;
    return out;
}

int main(){
    int reps = 20;
    if(const char* r = std::getenv("LUMA_BENCH_REPS")){ int v = std::atoi(r); if(v > 0) reps = v; }

    luma::Parser parser(luma::Language(luma::lang::language()));
    luma::ParseOptions opts = parser.options();
    opts.debug = false;
    parser.set_options(opts);

    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;

    // Case 1: many small declarations
    cases.push_back({ "declarations", repeat("let x: int = 1 + 2 * y;\nconst NAME = \"luma\";\n", 500) });

    // Case 2: functions with control flow
    cases.push_back({
        "functions",
        repeat("fn f(a: int, b: *int): int {\n"
               "    while a < 10 { a += 1; }\n"
               "    if a == 3 { return a; } else { return b as int; }\n"
               "}\n", 200)
    });

    // Case 3: deep member/call chains
    cases.push_back({ "chains", repeat("io::print(a.b.c.d, [1, 2, 3], 'x');\n", 500) });

    // Case 4: recovery-heavy input
    cases.push_back({ "recovery", repeat("let = ;\nfn g() { return 1 }\n", 300) });

    std::cout << "name,bytes,ms_parse,nodes,has_error\n";
    for(const auto& c : cases){
        auto r = bench_case(parser, c.prog, reps);
        std::cout << c.name << "," << c.prog.size() << "," << r.ms_parse << "," << r.nodes << "," << (r.has_error ? 1 : 0) << "\n";
    }
    return 0;
}
