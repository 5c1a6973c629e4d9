// Writes a job back out in the text form read by loader.hpp, including every assigned name.
#pragma once
#include <string>
#include "tmplc/compilation.hpp"
#include "tmplc/text/form.hpp"

namespace tmplc::text {

form_ptr expression_to_form(const ir::Expression& e);
form_ptr op_to_form(const ir::Op& op);
form_ptr job_to_form(CompilationJob& job);

std::string print_job(CompilationJob& job, bool pretty = true);

} // namespace tmplc::text
