// Lowering of job text forms into a CompilationJob.
//
//   (job :kind component :name "Comp" :compat tdb
//     (view :xref 0 :create [ (element-start :xref 1 :tag "div" :slot 0) ... ] :update [ ... ])
//     (view :xref 2 :parent 0 :fn "Preset" :create [ ... ]))
//
//   (job :kind host :name "Comp" (host :update [ (host-property :name "title" :expr title) ]))
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "tmplc/compilation.hpp"
#include "tmplc/text/form.hpp"

namespace tmplc::text {

struct load_error : text_error {
    load_error(const std::string& message, int line = -1, int col = -1): text_error("E0002", message, line, col){}
};

// Values fixed at job creation that override what the text declares.
struct LoadOptions {
    std::optional<CompatibilityMode> compatibility;
    std::optional<std::string> component_name;
};

std::unique_ptr<CompilationJob> load_job(const form& root, const LoadOptions& opts = {});
// parse + load_job
std::unique_ptr<CompilationJob> read_job(std::string_view src, const std::string& source_name = "<memory>", const LoadOptions& opts = {});

ir::ExprPtr load_expression(const form& f);
ir::OpPtr load_op(const form& f, CompilationJob& job);

} // namespace tmplc::text
