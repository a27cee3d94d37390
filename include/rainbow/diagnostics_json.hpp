// diagnostics_json.hpp - JSON serialization for check results
#pragma once
#include "rainbow/rainbow.hpp"
#include <string>

namespace rainbow {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize type checker diagnostics to a compact JSON string.
std::string diagnostics_to_json(const TypeCheckResult& r);

// Same shape plus the parse error, output type and effect set of a script check.
std::string diagnostics_to_json(const ScriptResult& r);

// If RAINBOW_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ScriptResult& r);

} // namespace rainbow
