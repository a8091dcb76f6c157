// In-memory split: feed a multi-declaration module through MemorySource/MemorySink.
#include <iostream>
#include <string>
#include "dol/diagnostics_json.hpp"
#include "dol/splitter.hpp"

using namespace dol;

int main(){
    const char* src = R"DOL(
// identity ontology
gene identity.core {
  identity.core has key
  key derive from secret
}

exegesis {
  The {key} is derived once and never rotated in place.
}

trait identity.rotation {
  rotation uses identity.core
  emits rotated
}

system identity.service @ 2.0 {
  system requires identity.rotation
  all keys is sealed
}
)DOL";

    MemorySource source; source.add("identity", src);
    MemorySink sink;
    auto report = split_modules(source, sink, {"identity"}, &std::cout);
    if(!report.success){
        std::cerr << report_to_json(report) << "\n";
        return 1;
    }
    for(const auto& path : sink.order){
        std::cout << "\n==> " << path << "\n" << sink.files.at(path);
    }
    return 0;
}
