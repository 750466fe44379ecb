#include <string>

#include "control.hpp"
#include "grammar.hpp"
#include "luma/errors.hpp"

namespace luma::lang {

void parse_source(std::string_view source, std::string_view filename, luma::TreeBuilder& builder){
    using namespace pegtl_front;
    tao::pegtl::memory_input<> in(source.data(), source.data() + source.size(), std::string(filename));
    try {
        // source_file always matches: unparseable text is recovered into ERROR nodes.
        if(!tao::pegtl::parse<grammar::source_file, tao::pegtl::nothing, tree_control>(in, builder))
            throw luma::ParseError("input does not match the luma grammar");
    } catch(const tao::pegtl::parse_error& e){
        const auto& positions = e.positions();
        if(positions.empty()) throw luma::ParseError(e.what());
        const auto& p = positions.front();
        throw luma::ParseError(e.what(), static_cast<int>(p.line), static_cast<int>(p.column));
    }
}

} // namespace luma::lang
