// diagnostics_json.hpp - diagnostic records and their JSON serialization
#pragma once
#include <string>
#include <vector>
#include "tmplc/errors.hpp"

namespace tmplc {

struct DiagnosticNote { std::string message; int line=-1; int col=-1; };
struct Diagnostic { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<DiagnosticNote> notes; };

// Diagnostic for a naming failure; notes name the unit being processed.
Diagnostic make_diagnostic(const naming_error& e);
Diagnostic make_diagnostic(const text_error& e);

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string: {"success":...,"errors":[...]}.
std::string diagnostics_to_json(const std::vector<Diagnostic>& errors);

// If the TMPLC_DIAG_JSON flag is enabled, print diagnostics JSON to stderr.
void maybe_print_json(const std::vector<Diagnostic>& errors);

} // namespace tmplc
