#include "tmplc/diagnostics_json.hpp"
#include <cstdio>
#include <sstream>

namespace tmplc {

Diagnostic make_diagnostic(const naming_error& e){
    Diagnostic d;
    d.code = e.code();
    d.message = e.what();
    d.hint = error_hint(e.kind);
    if(e.unit) d.notes.push_back(DiagnosticNote{"while naming unit " + std::to_string(*e.unit), -1, -1});
    return d;
}

Diagnostic make_diagnostic(const text_error& e){
    Diagnostic d;
    d.code = e.code;
    d.message = e.what();
    d.hint = e.code == "E0001" ? "check the job text for unbalanced or malformed forms" : "every job, view and op form needs its required keyword arguments";
    d.line = e.line;
    d.col = e.col;
    return d;
}

std::string json_escape(const std::string& s){
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c : s){
        const auto u = static_cast<unsigned char>(c);
        if(c == '"' || c == '\\'){ out += '\\'; out += c; }
        else if(c == '\n') out += "\\n";
        else if(c == '\r') out += "\\r";
        else if(c == '\t') out += "\\t";
        else if(u < 0x20){ out += "\\u00"; out += hex[u >> 4]; out += hex[u & 0xF]; }
        else out += c;
    }
    out += '"';
    return out;
}

namespace {

// Fields shared by a diagnostic and its notes: "message", "line", "col".
void write_located(std::ostringstream& os, const std::string& message, int line, int col){
    os << "\"message\":" << json_escape(message) << ",\"line\":" << line << ",\"col\":" << col;
}

void write_diagnostic(std::ostringstream& os, const Diagnostic& d){
    os << "{\"code\":" << json_escape(d.code) << ',';
    write_located(os, d.message, d.line, d.col);
    os << ",\"hint\":" << json_escape(d.hint) << ",\"notes\":[";
    const char* sep = "";
    for(const auto& n : d.notes){
        os << sep << '{';
        write_located(os, n.message, n.line, n.col);
        os << '}';
        sep = ",";
    }
    os << "]}";
}

} // namespace

std::string diagnostics_to_json(const std::vector<Diagnostic>& errors){
    std::ostringstream os;
    os << "{\"success\":" << (errors.empty() ? "true" : "false") << ",\"errors\":[";
    const char* sep = "";
    for(const auto& d : errors){
        os << sep;
        write_diagnostic(os, d);
        sep = ",";
    }
    os << "]}";
    return os.str();
}

void maybe_print_json(const std::vector<Diagnostic>& errors){
    if(!detail::env_flag_enabled("TMPLC_DIAG_JSON")) return;
    std::fprintf(stderr, "%s\n", diagnostics_to_json(errors).c_str());
}

} // namespace tmplc
