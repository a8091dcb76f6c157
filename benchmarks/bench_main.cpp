#include "dol/splitter.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_split; size_t declarations; };

static RunResult bench_case(const std::string &program){
    auto t0 = Clock::now();
    auto files = dol::split_text(program);
    auto t1 = Clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return { ms, files.size() };
}

// n copies of a gene/trait/constraint/system quartet with nested braces in bodies and exegesis
static std::string make_program(int n){
    std::ostringstream os;
    for(int i=0;i<n;++i){
        os << "// block " << i << "\n"
           << "gene mod" << i << ".entity {\n  mod" << i << ".entity has id\n  entity derive from base\n  nested { inner { deep } }\n}\n\n"
           << "exegesis {\n  Entity {name} number " << i << " with {nested braces}.\n}\n\n"
           << "trait mod" << i << ".behavior {\n  behavior uses mod" << i << ".entity\n  emits changed\n  is active\n}\n\n"
           << "constraint mod" << i << ".rules {\n  matches id unique\n  never id changes\n}\n\n"
           << "system mod" << i << ".runtime @ 1.0.0 {\n  system requires mod" << i << ".behavior\n  all entity is tracked\n}\n\n";
    }
    return os.str();
}

int main(){
    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;
    cases.push_back({ "small_10", make_program(10) });
    cases.push_back({ "medium_200", make_program(200) });
    cases.push_back({ "large_2000", make_program(2000) });

    std::cout << "name,ms_split,declarations\n";
    for(const auto &c : cases){
        auto r = bench_case(c.prog);
        std::cout << c.name << "," << r.ms_split << "," << r.declarations << "\n";
    }
    return 0;
}
