#include "luma/corpus.hpp"
#include "luma/errors.hpp"
#include <cctype>

namespace luma {

static bool rule_line(std::string_view line, char c){
    if(line.size() < 3) return false;
    for(char ch : line) if(ch != c) return false;
    return true;
}

static std::string_view trim_cr(std::string_view line){
    while(!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) line.remove_suffix(1);
    return line;
}

static std::string_view trim(std::string_view s){
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<CorpusCase> parse_corpus(std::string_view text){
    std::vector<std::string_view> lines;
    for(std::size_t pos = 0; pos <= text.size();){
        std::size_t nl = text.find('\n', pos);
        if(nl == std::string_view::npos){
            if(pos < text.size()) lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }

    std::vector<CorpusCase> cases;
    std::size_t i = 0;
    while(i < lines.size()){
        if(!rule_line(trim_cr(lines[i]), '=')){ ++i; continue; }
        CorpusCase c;
        c.line = static_cast<int>(i) + 1;
        if(i + 2 >= lines.size() || !rule_line(trim_cr(lines[i + 2]), '='))
            throw CorpusError("corpus: malformed header at line " + std::to_string(c.line));
        c.name = std::string(trim(lines[i + 1]));
        i += 3;

        std::string source;
        bool separated = false;
        for(; i < lines.size(); ++i){
            if(rule_line(trim_cr(lines[i]), '-')){ separated = true; ++i; break; }
            if(rule_line(trim_cr(lines[i]), '=')) break;
            source.append(lines[i]);
            source.push_back('\n');
        }
        if(!separated)
            throw CorpusError("corpus: case '" + c.name + "' at line " + std::to_string(c.line) + " has no '---' separator");
        while(!source.empty() && (source.back() == '\n' || source.back() == '\r')) source.pop_back();
        c.source = std::move(source);

        std::string expected;
        for(; i < lines.size() && !rule_line(trim_cr(lines[i]), '='); ++i){
            expected.append(lines[i]);
            expected.push_back('\n');
        }
        c.expected = std::string(trim(expected));
        cases.push_back(std::move(c));
    }
    return cases;
}

std::string normalize_sexp(std::string_view sexp){
    std::string out;
    bool pending_space = false;
    bool in_quote = false, escaped = false;
    for(char ch : sexp){
        if(in_quote){
            out.push_back(ch);
            if(escaped) escaped = false;
            else if(ch == '\\') escaped = true;
            else if(ch == '"') in_quote = false;
            continue;
        }
        if(std::isspace(static_cast<unsigned char>(ch))){ pending_space = true; continue; }
        if(pending_space && !out.empty() && out.back() != '(' && ch != ')') out.push_back(' ');
        pending_space = false;
        out.push_back(ch);
        if(ch == '"') in_quote = true;
    }
    return out;
}

CorpusOutcome run_corpus_case(const Parser& parser, const CorpusCase& c){
    CorpusOutcome r;
    Tree tree = parser.parse(c.source, c.name);
    r.actual = normalize_sexp(tree.to_sexp());
    r.expected = normalize_sexp(c.expected);
    r.passed = r.actual == r.expected;
    return r;
}

} // namespace luma
