#include "dol/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace dol {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_diagnostics_json(std::ostringstream& os, const std::vector<Diagnostic>& ds){
    os<<"[";
    for(size_t i=0;i<ds.size(); ++i){
        const auto &d=ds[i]; if(i) os<<",";
        os<<"{"
            "\"code\":"<<json_escape(d.code)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"hint\":"<<json_escape(d.hint)
            <<",\"module\":"<<json_escape(d.module)
            <<",\"line\":"<<d.line
            <<",\"col\":"<<d.col
            <<"}";
    }
    os<<"]";
}

std::string report_to_json(const SplitReport& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"total\":"<<r.total()<<",\"modules\":[";
    for(size_t i=0;i<r.modules.size(); ++i){
        const auto &m=r.modules[i]; if(i) os<<",";
        os<<"{\"module\":"<<json_escape(m.module)<<",\"declarations\":"<<m.declarations<<"}";
    }
    os<<"],\"errors\":";
    append_diagnostics_json(os, r.errors);
    os<<",\"warnings\":";
    append_diagnostics_json(os, r.warnings);
    os<<"}";
    return os.str();
}

void maybe_print_json(const SplitReport& r){
    if(const char* env = std::getenv("DOL_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=report_to_json(r);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace dol
