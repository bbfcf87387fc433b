// diagnostics_json.hpp - JSON serialization for compilation failures
#pragma once
#include "sapio/context.hpp"
#include "sapio/error.hpp"
#include <string>
#include <vector>

namespace sapio {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize reasons to a compact JSON string. No reasons means success.
std::string diagnostics_to_json(const std::vector<Reason>& reasons);

// If env.diagJson is set (SAPIO_DIAG_JSON=1), print diagnostics JSON to stderr.
void maybe_print_json(const std::vector<Reason>& reasons, const CompileEnv& env);

} // namespace sapio
