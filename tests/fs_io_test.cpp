#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "dol/errors.hpp"
#include "dol/splitter.hpp"
#include "test_env.hpp"

using namespace dol;
namespace fs = std::filesystem;

static std::string slurp(const fs::path& p){ std::ifstream ifs(p, std::ios::binary); std::ostringstream oss; oss << ifs.rdbuf(); return oss.str(); }

void run_fs_io_tests(){
    std::cout << "[fs-io] tests...\n";
    ScopedEnv trace("DOL_DEBUG_IO", "1");
    fs::path root = fs::temp_directory_path() / "dolsplit_fs_io_test";
    fs::remove_all(root);
    fs::create_directories(root);
    {
        std::ofstream ofs(root / "state.dol", std::ios::binary);
        ofs << "gene state.value {\n  value has kind\n}\n\nexegesis {\n  Values carry a {kind}.\n}\n";
    }
    FileSystemSource source(root);
    assert(source.path_of("state") == root / "state.dol");
    assert(!source.read("cluster"));
    auto text = source.read("state");
    assert(text && text->find("gene state.value") == 0);

    FileSystemSink sink(root / "out");
    auto rep = split_modules(source, sink, {"state", "cluster"});
    assert(rep.success && rep.total() == 1);
    assert(rep.warnings.size() == 1 && rep.warnings[0].module == "cluster");
    for(const char* dir : {"genes", "traits", "constraints", "systems"})
        assert(fs::is_directory(root / "out" / "state" / dir));
    assert(!fs::exists(root / "out" / "cluster"));
    assert(slurp(root / "out" / "state" / "genes" / "state_value.dol") ==
           "gene state.value {\n  value has kind\n}\n\nexegesis {\n  Values carry a <kind>.\n}\n");

    // a file where a directory is expected makes writing fail loudly
    {
        std::ofstream blocker(root / "blocked", std::ios::binary);
        blocker << "x";
    }
    FileSystemSink bad(root / "blocked");
    bool threw = false;
    try { bad.begin_module("state"); }
    catch(const io_error& e){ threw = true; assert(e.code == kIoFailure); }
    assert(threw);

    fs::remove_all(root);
    (void)text; (void)rep;
    std::cout << "[fs-io] tests passed\n";
}
