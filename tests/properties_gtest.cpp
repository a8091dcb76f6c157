#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "dol/braces.hpp"
#include "dol/errors.hpp"
#include "dol/normalize.hpp"
#include "dol/scanner.hpp"
#include "dol/splitter.hpp"

using namespace dol;

namespace {

const std::vector<DeclKind> kAllKinds{DeclKind::Gene, DeclKind::Trait, DeclKind::Constraint, DeclKind::System};

std::string repeat(const std::string& s, int n){
    std::string out;
    for(int i = 0; i < n; ++i) out += s;
    return out;
}

// Bodies mixing every rule family, canonical lines and layout edge cases.
const std::vector<std::string> kBodies{
    "",
    "\n",
    "\n  a.b has c\n  derive from x\n  require y\n  require clause z\n",
    "\n  subject uses bar\n  emits e\n  is active\n  x.y is z\n",
    "\n  matches id unique\n  never changes\n  matches require clause x\n",
    "\n  system requires a.b\n  requires foo.bar\n  all things is fine\n  requires q >= 1.0.0\n",
    "\t\tuses uses x  \r\n\n   \n  // kept as is  \n  a. is b\n",
    "\n  all all is is x\n  system requires system requires y\n  matches never z\n",
    "no newline at all",
    "\n  " + repeat("uses ", 12) + "x\n  " + repeat("system requires ", 12) + "y\n",
};

} // namespace

TEST(BraceMatcher, RoundTripsBalancedContent){
    for(std::string x : {"", "abc", "a{b}c", "{}{}", "{{{deep}}}", "line\n{ nested\n}\n"}){
        auto span = match_braces("{" + x + "}", 0);
        EXPECT_EQ(span.body, x);
        EXPECT_EQ(span.close, x.size() + 1);
    }
}

TEST(BraceMatcher, FailsLoudly){
    EXPECT_THROW(match_braces("{{}", 0), unterminated_block);
    EXPECT_THROW(match_braces("abc", 1), malformed_input);
}

TEST(Normalizer, IsIdempotent){
    for(auto kind : kAllKinds){
        for(const auto& body : kBodies){
            auto once = normalize_body(body, kind);
            EXPECT_EQ(normalize_body(once, kind), once) << keyword_of(kind) << " body: " << body;
        }
    }
}

TEST(Normalizer, PreservesLineCount){
    auto lines = [](const std::string& s){ size_t n = 1; for(char c : s) if(c == '\n') ++n; return n; };
    for(auto kind : kAllKinds){
        for(const auto& body : kBodies){
            EXPECT_EQ(lines(normalize_body(body, kind)), lines(body)) << keyword_of(kind) << " body: " << body;
        }
    }
}

TEST(Normalizer, ReachesFixedPointOnLongChains){
    EXPECT_EQ(normalize_line(repeat("uses ", 12) + "x", DeclKind::Trait), "uses x");
    EXPECT_EQ(normalize_line("  " + repeat("uses ", 40) + "x", DeclKind::Trait), "  uses x");
}

TEST(Normalizer, Scenarios){
    EXPECT_EQ(normalize_line("subject uses bar", DeclKind::Trait), "uses bar");
    EXPECT_EQ(normalize_line("never x", DeclKind::Constraint), "invariant never x");
    EXPECT_EQ(normalize_line("requires foo.bar", DeclKind::System), "requires foo.bar >= 0.0.1");
    EXPECT_EQ(normalize_line("authentication.temporal matches x", DeclKind::Gene), "temporal matches x");
}

TEST(Scanner, YieldsEveryDeclarationInOrderWithoutOverlap){
    const int n = 25;
    std::string src;
    for(int i = 0; i < n; ++i){
        const char* kw = keyword_of(kAllKinds[static_cast<size_t>(i) % kAllKinds.size()]);
        src += std::string(kw) + " item" + std::to_string(i) + " {\n  body " + std::to_string(i) + " { inner }\n}\n";
        if(i % 3 == 0) src += "exegesis {\n  about " + std::to_string(i) + "\n}\n";
        src += "\n";
    }
    Scanner sc(src);
    size_t last_cursor = 0;
    int count = 0;
    while(auto d = sc.next()){
        EXPECT_EQ(d->name, "item" + std::to_string(count));
        EXPECT_EQ(d->body, "\n  body " + std::to_string(count) + " { inner }\n");
        EXPECT_EQ(d->has_exegesis, count % 3 == 0);
        EXPECT_GT(sc.cursor(), last_cursor);
        last_cursor = sc.cursor();
        ++count;
    }
    EXPECT_EQ(count, n);
}

TEST(Splitter, UnterminatedBodyHaltsTheFile){
    EXPECT_THROW(split_text("gene Foo { no closing brace"), unterminated_block);
    EXPECT_THROW(split_text("gene ok {}\ngene Foo { no closing brace\ngene later {}\n"), unterminated_block);
}

TEST(ExegesisSanitizer, Scenarios){
    EXPECT_EQ(sanitize_exegesis("does {name} things"), "does <name> things");
    EXPECT_EQ(sanitize_exegesis("{"), "(");
}
