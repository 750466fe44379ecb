// Tree walking example: parse a snippet, list its function declarations with
// a TreeCursor, then locate the node under a byte offset.
#include <iostream>
#include <string>
#include "luma/lang/luma.hpp"
#include "luma/parser.hpp"

int main(){
    const char* src = R"LUMA(
        // geometry helpers
        fn area(w: int, h: int): int { return w * h; }
        fn perimeter(w: int, h: int): int { return 2 * (w + h); }
        let unit = area(1, 1);
    )LUMA";

    luma::Parser parser(luma::Language(luma::lang::language()));
    luma::Tree tree = parser.parse(src, "example.lx");
    luma::Node root = tree.root_node();
    if(root.has_error()){
        std::cerr << "unexpected syntax error\n";
        return 1;
    }

    luma::TreeCursor cursor(root);
    int functions = 0;
    // Depth-first pre-order walk.
    for(;;){
        luma::Node n = cursor.current_node();
        if(n.type() == "function_declaration"){
            luma::Node name = n.child_by_type("identifier");
            luma::Point p = n.start_point();
            std::cout << "fn " << name.text() << " at " << (p.row + 1) << ":" << (p.column + 1) << "\n";
            ++functions;
        }
        if(cursor.goto_first_child()) continue;
        bool moved = false;
        while(!moved){
            if(cursor.goto_next_sibling()){ moved = true; break; }
            if(!cursor.goto_parent()) break;
        }
        if(!moved) break;
    }

    std::string text(src);
    auto at = static_cast<std::uint32_t>(text.find("area(1"));
    luma::Node hit = root.named_descendant_for_byte_range(at, at + 4);
    std::cout << "node at 'area(1': " << hit.type() << " -> " << hit.parent().type() << "\n";
    std::cout << "walk example OK (" << functions << " functions)\n";
    return functions == 2 ? 0 : 1;
}
