#include <cassert>
#include <iostream>
#include <string>
#include "dol/diagnostics_json.hpp"
#include "test_env.hpp"

using namespace dol;

static SplitReport failing_run(){
    MemorySource src;
    src.add("container", "gene a {}\n").add("broken", "gene \"quoted\" x {\ngene b {\n");
    MemorySink sink;
    return split_modules(src, sink, {"container", "state", "broken"});
}

static void test_json_success(){
    MemorySource src; src.add("api", "gene a {}\n");
    MemorySink sink;
    auto js = report_to_json(split_modules(src, sink, {"api"}));
    assert(js.find("\"success\":true") != std::string::npos);
    assert(js.find("\"total\":1") != std::string::npos);
    assert(js.find("\"errors\":[]") != std::string::npos);
    assert(js.find("\"warnings\":[]") != std::string::npos);
}

static void test_json_error_and_warning(){
    auto rep = failing_run();
    auto js = report_to_json(rep);
    assert(js.find("\"success\":false") != std::string::npos);
    assert(js.find("{\"module\":\"container\",\"declarations\":1}") != std::string::npos);
    auto e = js.find("\"code\":\"E0101\"");
    assert(e != std::string::npos);
    assert(js.find("\"module\":\"broken\"", e) != std::string::npos);
    assert(js.find("\"line\":2", e) != std::string::npos);
    assert(js.find("\"code\":\"W0201\"") != std::string::npos);
    (void)e;
}

static void test_escape(){
    assert(json_escape("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");
}

int run_diagnostics_json_tests(){
    std::cout << "[diagnostics] JSON tests...\n";
    test_json_success();
    test_json_error_and_warning();
    test_escape();
    {
        ScopedEnv env("DOL_DIAG_JSON", "1");
        maybe_print_json(failing_run());
    }
    std::cout << "[diagnostics] JSON tests passed\n";
    return 0;
}
