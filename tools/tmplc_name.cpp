// tmplc-name: read a job in text form, run the naming phase, print the named job.
#include <string>
#include <vector>
#include "tmplc/diagnostics_json.hpp"
#include "tmplc/phases/naming.hpp"
#include "tmplc/text/loader.hpp"
#include "tmplc/text/printer.hpp"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/ToolOutputFile.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

using namespace tmplc;

namespace {

enum class CompatOpt { FromInput, Full, Tdb };

llvm::cl::OptionCategory NamingCategory("tmplc-name options");

llvm::cl::opt<std::string> InputFilename(llvm::cl::Positional, llvm::cl::desc("<input job>"), llvm::cl::init("-"), llvm::cl::cat(NamingCategory));
llvm::cl::opt<std::string> OutputFilename("o", llvm::cl::desc("Output file (default: stdout)"), llvm::cl::value_desc("filename"), llvm::cl::init("-"), llvm::cl::cat(NamingCategory));
llvm::cl::opt<CompatOpt> Compat("compat", llvm::cl::desc("Compatibility mode, overriding the job's :compat"),
    llvm::cl::values(
        clEnumValN(CompatOpt::FromInput, "input", "Use the mode declared by the job (default)"),
        clEnumValN(CompatOpt::Full, "full", "Current naming rules"),
        clEnumValN(CompatOpt::Tdb, "tdb", "Legacy template definition builder rules")),
    llvm::cl::init(CompatOpt::FromInput), llvm::cl::cat(NamingCategory));
llvm::cl::opt<std::string> ComponentName("component", llvm::cl::desc("Component base name, overriding the job's :name"), llvm::cl::value_desc("name"), llvm::cl::cat(NamingCategory));
llvm::cl::opt<bool> Pretty("pretty", llvm::cl::desc("Indent the printed job (default: one line)"), llvm::cl::init(false), llvm::cl::cat(NamingCategory));

int report(const Diagnostic& d, int exit_code){
    llvm::WithColor::error(llvm::errs(), "tmplc-name") << d.message;
    if(d.line >= 0) llvm::errs() << " (line " << d.line << ", col " << d.col << ")";
    llvm::errs() << "\n";
    for(auto& n : d.notes) llvm::WithColor::note(llvm::errs(), "tmplc-name") << n.message << "\n";
    if(!d.hint.empty()) llvm::WithColor::remark(llvm::errs(), "tmplc-name") << d.hint << "\n";
    maybe_print_json({d});
    return exit_code;
}

} // namespace

int main(int argc, char** argv){
    llvm::InitLLVM X(argc, argv);
    llvm::cl::HideUnrelatedOptions(NamingCategory);
    llvm::cl::ParseCommandLineOptions(argc, argv, "template IR naming driver\n");

    auto bufOrErr = llvm::MemoryBuffer::getFileOrSTDIN(InputFilename);
    if(!bufOrErr){
        llvm::WithColor::error(llvm::errs(), "tmplc-name") << "cannot read '" << InputFilename << "': " << bufOrErr.getError().message() << "\n";
        return 1;
    }

    text::LoadOptions opts;
    if(Compat == CompatOpt::Full) opts.compatibility = CompatibilityMode::Full;
    else if(Compat == CompatOpt::Tdb) opts.compatibility = CompatibilityMode::TemplateDefinitionBuilder;
    if(!ComponentName.empty()) opts.component_name = ComponentName.getValue();

    std::unique_ptr<CompilationJob> job;
    try {
        job = text::read_job((*bufOrErr)->getBuffer().str(), InputFilename, opts);
    } catch(const text_error& e){
        return report(make_diagnostic(e), 2);
    }

    try {
        phases::phase_naming(*job);
    } catch(const naming_error& e){
        return report(make_diagnostic(e), 3);
    }

    std::error_code EC;
    llvm::ToolOutputFile out(OutputFilename, EC, llvm::sys::fs::OF_Text);
    if(EC){
        llvm::WithColor::error(llvm::errs(), "tmplc-name") << "cannot open '" << OutputFilename << "': " << EC.message() << "\n";
        return 1;
    }
    out.os() << text::print_job(*job, Pretty) << "\n";
    out.keep();
    maybe_print_json({});
    return 0;
}
