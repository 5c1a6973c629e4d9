#include "tmplc/errors.hpp"

namespace tmplc {

const char* error_code(NamingErrorKind k){
    switch(k){
        case NamingErrorKind::SlotUnassigned: return "E0101";
        case NamingErrorKind::WrongUnitKind: return "E0102";
        case NamingErrorKind::VariableNotNamed: return "E0103";
        case NamingErrorKind::MissingTag: return "E0104";
        case NamingErrorKind::UnknownView: return "E0105";
        case NamingErrorKind::ViewReentered: return "E0106";
    }
    return "E0100";
}

const char* error_hint(NamingErrorKind k){
    switch(k){
        case NamingErrorKind::SlotUnassigned: return "slot allocation must run before naming";
        case NamingErrorKind::WrongUnitKind: return "templates and repeaters may only appear in component views";
        case NamingErrorKind::VariableNotNamed: return "declare the variable with a variable op in the same view";
        case NamingErrorKind::MissingTag: return "element listeners must carry the tag of their element";
        case NamingErrorKind::UnknownView: return "register the embedded view with the job before naming";
        case NamingErrorKind::ViewReentered: return "each embedded view must be declared by exactly one template or repeater of another view";
    }
    return "";
}

} // namespace tmplc
