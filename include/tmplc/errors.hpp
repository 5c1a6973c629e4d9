// Internal-consistency errors raised while naming a compilation job.
#pragma once
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "tmplc/ir/expression.hpp"

namespace tmplc {

enum class NamingErrorKind {
    SlotUnassigned,   // E0101 listener/template/repeater reached naming without a slot
    WrongUnitKind,    // E0102 template or repeater inside a unit that is not a view
    VariableNotNamed, // E0103 read of a variable never declared in the unit
    MissingTag,       // E0104 element listener without a tag name
    UnknownView,      // E0105 template/repeater pointing at an xref with no view
    ViewReentered     // E0106 a view reached twice (self reference, cycle, or two owning ops)
};

const char* error_code(NamingErrorKind k);
const char* error_hint(NamingErrorKind k);

struct naming_error : std::runtime_error {
    naming_error(NamingErrorKind kind, const std::string& message, std::optional<ir::XrefId> unit = std::nullopt)
        : std::runtime_error(std::string(error_code(kind)) + ": " + message), kind(kind), unit(unit){}
    NamingErrorKind kind;
    std::optional<ir::XrefId> unit; // unit being named when the error was raised
    const char* code() const { return error_code(kind); }
};

// Job text that cannot be read: bad syntax (E0001) or forms that do not describe a job (E0002).
struct text_error : std::runtime_error {
    text_error(std::string code, const std::string& message, int line = -1, int col = -1)
        : std::runtime_error(message), code(std::move(code)), line(line), col(col){}
    std::string code;
    int line;
    int col;
};

namespace detail {
    // Feature flags sourced from environment ("1", "t", "y" enable).
    inline bool env_flag_enabled(const char* name){
        const char* v = std::getenv(name);
        return v && (v[0] == '1' || v[0] == 't' || v[0] == 'T' || v[0] == 'y' || v[0] == 'Y');
    }
}

} // namespace tmplc
