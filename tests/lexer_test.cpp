#include <cassert>
#include <iostream>
#include <string>
#include "dol/lexer.hpp"

using namespace dol;

static void test_token_kinds_and_positions(){
    std::string src = "gene a.b {\n  x // c\n}";
    auto toks = tokenize(src);
    assert(toks.size() == 14);
    assert(toks[0].is(TokenKind::Word) && toks[0].text == "gene");
    assert(toks[1].is(TokenKind::Space));
    assert(toks[3].is_punct('.'));
    assert(toks[6].is(TokenKind::LBrace) && toks[6].offset == 9);
    assert(toks[7].is(TokenKind::Newline));
    assert(toks[8].is(TokenKind::Space) && toks[8].text == "  ");
    assert(toks[11].is(TokenKind::Comment) && toks[11].text == "// c");
    assert(toks[11].line == 2 && toks[11].col == 5);
    assert(toks[13].is(TokenKind::RBrace) && toks[13].line == 3 && toks[13].col == 1);
    (void)toks;
}

static void test_concatenation_reproduces_input(){
    std::string src = "system s @ 1.0 > x {\r\n\t{nested}} // tail\nexegesis{é}";
    std::string joined;
    for(const auto& t : tokenize(src)) joined.append(t.text);
    assert(joined == src);
}

static void test_word_boundaries(){
    // high bytes are word characters, '/' alone is punctuation
    auto toks = tokenize("café/x");
    assert(toks.size() == 3);
    assert(toks[0].is(TokenKind::Word) && toks[0].text == "café");
    assert(toks[1].is_punct('/'));
    assert(std::string(to_string(toks[2].kind)) == "word");
    (void)toks;
}

void run_lexer_tests(){
    std::cout << "[lexer] tests...\n";
    test_token_kinds_and_positions();
    test_concatenation_reproduces_input();
    test_word_boundaries();
    std::cout << "[lexer] tests passed\n";
}
