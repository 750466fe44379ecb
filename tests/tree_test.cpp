#include <cassert>
#include <iostream>
#include <stdexcept>
#include "luma/lang/luma.hpp"
#include "luma/parser.hpp"

using namespace luma;

static Parser make_parser(){
    Parser p(Language(lang::language()));
    ParseOptions o; // ignore LUMA_* flags from the caller's environment
    p.set_options(o);
    return p;
}

static void test_navigation(){
    Parser p = make_parser();
    Tree tree = p.parse("let x = 5;\nlet y = x;");
    Node root = tree.root_node();
    assert(root.type() == "source_file");
    assert(root.start_byte() == 0 && root.end_byte() == tree.source().size());
    assert(root.child_count() == 2 && root.named_child_count() == 2);
    assert(!root.has_error());

    Node second = root.named_child(1);
    assert(second.start_point() == (Point{1, 0}));
    assert(second.prev_sibling() == root.child(0));
    assert(second.next_sibling().is_null());

    Node let1 = root.named_child(0).named_child(0);
    assert(let1.type() == "let_declaration");
    assert(let1.child(0).type() == "let" && !let1.child(0).is_named());
    Node ident = let1.child_by_type("identifier");
    assert(ident.text() == "x");
    assert(ident.parent() == let1);
    assert(ident.prev_sibling().type() == "let");
    assert(ident.next_named_sibling().type() == "expression");
    assert(let1.child_by_type("while").is_null());
    assert(let1.named_children().size() == 2);
    assert(let1.children().size() == 5);

    Range r = ident.range();
    assert(r.start_byte == 4 && r.end_byte == 5 && r.start_point == (Point{0, 4}) && r.end_point == (Point{0, 5}));
}

static void test_descendant_lookup(){
    Parser p = make_parser();
    Tree tree = p.parse("let x = 5;");
    Node root = tree.root_node();
    assert(root.descendant_for_byte_range(4, 5).type() == "identifier");
    assert(root.named_descendant_for_byte_range(8, 9).type() == "number");
    assert(root.descendant_for_byte_range(9, 10).type() == ";");
    assert(root.named_descendant_for_byte_range(9, 10).type() == "let_declaration");

    Tree small = p.parse("x;");
    // source_file statement expression_statement expression identifier ';'
    assert(small.root_node().descendant_count() == 6);
}

static void test_cursor(){
    Parser p = make_parser();
    Tree tree = p.parse("let x = 5;\nlet y = x;");
    TreeCursor c(tree.root_node());
    assert(!c.goto_next_sibling() && !c.goto_parent());
    assert(c.goto_first_child() && c.depth() == 1);
    assert(c.current_node().type() == "statement");
    assert(c.goto_next_sibling());
    assert(!c.goto_next_sibling());
    assert(c.goto_parent() && c.depth() == 0);
    assert(c.current_node() == tree.root_node());
    assert(c.goto_first_child_for_byte(10) == 1);
    c.reset(tree.root_node());
    assert(c.goto_first_child_for_byte(3) == 0);
    assert(c.goto_first_child_for_byte(1000) == -1);
    c.reset(tree.root_node().named_child(0));
    assert(!c.goto_parent() && "cursor never leaves its start node");
}

static void test_errors_and_extras(){
    Parser p = make_parser();
    Tree tree = p.parse("// note\nlet x = 1");
    Node root = tree.root_node();
    assert(root.has_error());
    Node comment = root.child(0);
    assert(comment.type() == "comment" && comment.is_extra() && comment.text() == "// note");
    Node let1 = root.named_child(1).named_child(0);
    Node miss = let1.child(let1.child_count() - 1);
    assert(miss.is_missing() && miss.type() == ";" && miss.text().empty());
    assert(root.to_sexp() == "(source_file (comment) (statement (let_declaration (identifier) (expression (literal (number))) (MISSING \";\"))))");

    Tree bad = p.parse("let = 5;");
    assert(bad.root_node().child(0).is_error());
    assert(bad.root_node().child(0).type() == "ERROR");
    assert(bad.root_node().child(0).text() == "let = 5;");
    assert(bad.root_node().child(0).named_child(0).text() == "5");
}

static void test_null_node_queries(){
    Parser p = make_parser();
    Tree tree = p.parse("x;");
    Node gone = tree.root_node().named_child(5);
    assert(gone.is_null() && !gone);
    assert(gone.child(0).is_null() && gone.named_child(0).is_null());
    assert(gone.child_by_type("identifier").is_null());
    assert(gone.parent().is_null() && gone.next_sibling().is_null() && gone.prev_named_sibling().is_null());
    assert(gone.type().empty() && gone.text().empty() && gone.to_sexp().empty());
    assert(gone.symbol() == 0 && gone.child_count() == 0 && gone.named_child_count() == 0);
    assert(!gone.is_named() && !gone.is_error() && !gone.is_missing() && !gone.has_error() && !gone.is_extra());
    assert(gone.start_byte() == 0 && gone.end_byte() == 0 && gone.start_point() == (Point{}));
    assert(gone.children().empty() && gone.named_children().empty() && gone.descendant_count() == 0);
    assert(gone.descendant_for_byte_range(0, 1).is_null());
    // Chained lookups past the end stay null.
    assert(tree.root_node().named_child(0).named_child(3).child(0).type().empty());

    TreeCursor c(gone);
    assert(!c.goto_first_child() && c.goto_first_child_for_byte(0) == -1);
}

static void test_tree_handles(){
    Tree empty;
    assert(empty.empty() && empty.root_node().is_null() && empty.to_sexp().empty());
    bool threw = false;
    try { (void)empty.language(); } catch(const std::logic_error&){ threw = true; }
    assert(threw);

    Parser p = make_parser();
    Tree t1 = p.parse("x;");
    Tree t2 = t1;
    assert(t1.root_node() == t2.root_node());
    assert(t2.language().name() == "luma");
    assert(t1.point_at(1) == (Point{0, 1}));
}

void run_tree_tests(){
    test_navigation();
    test_descendant_lookup();
    test_cursor();
    test_errors_and_extras();
    test_tree_handles();
    test_null_node_queries();
    std::cout << "Tree tests passed\n";
}
