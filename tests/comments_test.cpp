#include <cassert>
#include <iostream>
#include "dol/comments.hpp"

using namespace dol;

void run_comment_tests(){
    std::cout << "[comments] tests...\n";
    {
        auto s = strip_comments("a // x\nb//y\n");
        assert(s.text == "a \nb\n");
        assert(s.comments.size() == 2);
        assert(s.comments[0].line == 1 && s.comments[0].col == 3 && s.comments[0].text == "// x");
        assert(s.comments[1].line == 2 && s.comments[1].col == 2 && s.comments[1].text == "//y");
    }
    {
        // newlines survive, so line numbers keep meaning
        auto s = strip_comments("// one\n// two\ngene g {\n}");
        assert(s.text == "\n\ngene g {\n}");
    }
    {
        // no multi-line comment form; a lone slash is kept
        auto s = strip_comments("a / b /* c */");
        assert(s.text == "a / b /* c */");
        assert(s.comments.empty());
    }
    {
        auto s = strip_comments("see http://example.org");
        assert(s.text == "see http:");
    }
    std::cout << "[comments] tests passed\n";
}
