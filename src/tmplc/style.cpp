#include "tmplc/style.hpp"

namespace tmplc {

namespace {
inline bool is_lower(char c){ return c >= 'a' && c <= 'z'; }
inline bool is_upper(char c){ return c >= 'A' && c <= 'Z'; }
inline bool is_digit(char c){ return c >= '0' && c <= '9'; }
inline bool is_word_char(char c){ return is_lower(c) || is_upper(c) || is_digit(c) || c == '_'; }
inline bool is_utf8_continuation(char c){ return ((unsigned char)c & 0xC0) == 0x80; }
inline char to_lower(char c){ return is_upper(c) ? (char)(c - 'A' + 'a') : c; }
}

// A multi-byte UTF-8 sequence is one character and becomes a single '_'.
std::string sanitize_identifier(std::string_view name){
    std::string out;
    out.reserve(name.size());
    for(size_t i = 0; i < name.size(); ++i){
        char c = name[i];
        if(is_word_char(c)){ out += c; continue; }
        out += '_';
        if((unsigned char)c >= 0xC0)
            while(i + 1 < name.size() && is_utf8_continuation(name[i + 1])) ++i;
    }
    return out;
}

std::string hyphenate(std::string_view name){
    std::string out; out.reserve(name.size() + 4);
    size_t i = 0;
    // Matches are non-overlapping lower/upper pairs: "aBC" -> "a-bc".
    while(i < name.size()){
        if(i + 1 < name.size() && is_lower(name[i]) && is_upper(name[i+1])){
            out += name[i]; out += '-'; out += name[i+1];
            i += 2;
            continue;
        }
        out += name[i++];
    }
    for(auto& c : out) c = to_lower(c);
    return out;
}

std::string normalize_style_prop_name(std::string_view name){
    if(name.substr(0, 2) == "--") return std::string(name);
    return hyphenate(name);
}

std::string strip_important(std::string_view name){
    auto pos = name.find("!important");
    if(pos == std::string_view::npos) return std::string(name);
    return std::string(name.substr(0, pos));
}

} // namespace tmplc
