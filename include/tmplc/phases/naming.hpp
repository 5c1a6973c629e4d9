// Naming phase: generate names for view functions, listener handlers and variables across all
// views of a job, then propagate variable names into the reads of those variables.
#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>
#include "tmplc/compilation.hpp"
#include "tmplc/errors.hpp"

namespace tmplc::phases {

// Job-wide counter behind variable names, plus the views entered so far.
// Threaded by reference through the whole traversal.
struct NamingState {
    int index = 0;
    std::unordered_set<ir::XrefId> entered;
};

// Variable names assigned while scanning one unit, keyed by the declaring op's xref.
using VariableNameTable = std::unordered_map<ir::XrefId, std::string>;

// Entry point: names the root unit and, recursively, every view it declares.
void phase_naming(CompilationJob& job);

// Name everything declared directly in `unit`, recurse into child views, then backfill reads.
// Throws naming_error on an inconsistent IR, including a view entered a second time.
void name_view(CompilationUnit& unit, const std::string& base_name, NamingState& state, bool compatibility);

// Name of `variable`, allocated from `state` on first use and returned unchanged afterwards.
//   Context     ctx_r<n>       (counter read, then incremented)
//   Identifier  <ident>_r<n>   (counter incremented, then read)
//   otherwise   _r<n>          (counter incremented, then read)
const std::string& get_variable_name(ir::SemanticVariable& variable, NamingState& state);

// Second traversal of a unit: fill in every unnamed variable read from `names`.
void backfill_variable_names(CompilationUnit& unit, const VariableNameTable& names);

} // namespace tmplc::phases
