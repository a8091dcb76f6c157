// diagnostics_json.hpp - JSON serialization for SplitReport diagnostics
#pragma once
#include "dol/splitter.hpp"
#include <string>

namespace dol {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a split run to a compact JSON string.
std::string report_to_json(const SplitReport& r);

// If DOL_DIAG_JSON=1 in the environment, print the report JSON to stderr.
void maybe_print_json(const SplitReport& r);

} // namespace dol
