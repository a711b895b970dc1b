// diagnostics_json.hpp - JSON serialization for diagnostics lists
#pragma once
#include "ccl/diagnostics.hpp"
#include "ccl/json_writer.hpp"
#include <string>
#include <vector>

namespace ccl {

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings);

// If CCL_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(bool success, const std::vector<Diagnostic>& errors, const std::vector<Diagnostic>& warnings);

} // namespace ccl
