// Feature flags sourced from environment
#pragma once
#include <cstdlib>

namespace dol::detail {

inline bool env_flag_enabled(const char* name)
{
    const char* v = std::getenv(name);
    return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
}

} // namespace dol::detail
