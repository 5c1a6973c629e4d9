// form.cpp - PEGTL-driven reader and printers for job text forms
#include "tmplc/text/form.hpp"
#include "tmplc/text/grammar.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <limits>

namespace tmplc::text {

namespace {

namespace pegtl = tao::pegtl;

struct build_state {
    struct frame { bool is_vector; int line; int col; std::vector<form_ptr> elems; };
    std::vector<frame> stack;
    form_ptr result;
    void push(form_ptr f){
        if(stack.empty()) result = std::move(f); else stack.back().elems.push_back(std::move(f));
    }
};

template<typename ActionInput>
form_ptr positioned(const ActionInput& in, form_data d){
    auto f = make_form(std::move(d));
    const auto pos = in.position();
    f->line = (int)pos.line; f->col = (int)pos.column;
    return f;
}

std::string unescape(const std::string& raw){
    std::string out; out.reserve(raw.size());
    for(size_t i=0;i<raw.size();++i){
        char c = raw[i];
        if(c != '\\' || i+1 >= raw.size()){ out += c; continue; }
        char e = raw[++i];
        switch(e){
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            default: out += e; break;
        }
    }
    return out;
}

template<typename Rule> struct action : pegtl::nothing<Rule> {};

template<> struct action<grammar::list_open> {
    template<typename ActionInput> static void apply(const ActionInput& in, build_state& s){
        const auto pos = in.position();
        s.stack.push_back(build_state::frame{false, (int)pos.line, (int)pos.column, {}});
    }
};
template<> struct action<grammar::vector_open> {
    template<typename ActionInput> static void apply(const ActionInput& in, build_state& s){
        const auto pos = in.position();
        s.stack.push_back(build_state::frame{true, (int)pos.line, (int)pos.column, {}});
    }
};
struct close_collection {
    template<typename ActionInput> static void apply(const ActionInput&, build_state& s){
        auto fr = std::move(s.stack.back());
        s.stack.pop_back();
        form_ptr f = fr.is_vector ? make_form(vector_t{std::move(fr.elems)}) : make_form(list{std::move(fr.elems)});
        f->line = fr.line; f->col = fr.col;
        s.push(std::move(f));
    }
};
template<> struct action<grammar::list_close> : close_collection {};
template<> struct action<grammar::vector_close> : close_collection {};

template<> struct action<grammar::string_tok> {
    template<typename ActionInput> static void apply(const ActionInput& in, build_state& s){
        std::string raw = in.string();
        s.push(positioned(in, form_data{std::in_place_type<std::string>, unescape(raw.substr(1, raw.size() - 2))}));
    }
};
template<> struct action<grammar::number_tok> {
    template<typename ActionInput> static void apply(const ActionInput& in, build_state& s){
        std::string num = in.string();
        bool is_float = num.find_first_of(".eE") != std::string::npos;
        const auto pos = in.position();
        try {
            if(is_float) s.push(positioned(in, form_data{std::in_place_type<double>, std::stod(num)}));
            else s.push(positioned(in, form_data{std::in_place_type<int64_t>, (int64_t)std::stoll(num)}));
        } catch(const std::out_of_range&){
            throw parse_error("number out of range: " + num, (int)pos.line, (int)pos.column);
        }
    }
};
template<> struct action<grammar::special_float_tok> {
    template<typename ActionInput> static void apply(const ActionInput& in, build_state& s){
        std::string tok = in.string();
        double d = tok == "##NaN" ? std::numeric_limits<double>::quiet_NaN()
                 : tok == "##-Inf" ? -std::numeric_limits<double>::infinity()
                 : std::numeric_limits<double>::infinity();
        s.push(positioned(in, form_data{std::in_place_type<double>, d}));
    }
};
template<> struct action<grammar::keyword_tok> {
    template<typename ActionInput> static void apply(const ActionInput& in, build_state& s){
        s.push(positioned(in, keyword{in.string().substr(1)}));
    }
};
template<> struct action<grammar::symbol_tok> {
    template<typename ActionInput> static void apply(const ActionInput& in, build_state& s){
        std::string name = in.string();
        if(name == "nil") s.push(positioned(in, std::monostate{}));
        else if(name == "true") s.push(positioned(in, form_data{std::in_place_type<bool>, true}));
        else if(name == "false") s.push(positioned(in, form_data{std::in_place_type<bool>, false}));
        else s.push(positioned(in, symbol{std::move(name)}));
    }
};

std::string quote(const std::string& s){
    std::string out = "\"";
    for(char c : s){
        switch(c){
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out + '"';
}

// Shortest %g rendering that reads back to the same double, always marked as floating point.
std::string format_double(double d){
    if(std::isnan(d)) return "##NaN";
    if(std::isinf(d)) return d < 0 ? "##-Inf" : "##Inf";
    char buf[32];
    for(int prec = 15; prec <= 17; ++prec){
        std::snprintf(buf, sizeof(buf), "%.*g", prec, d);
        if(std::strtod(buf, nullptr) == d) break;
    }
    std::string out = buf;
    if(out.find_first_of(".eE") == std::string::npos) out += ".0";
    return out;
}

std::string join(const std::vector<form_ptr>& elems, char open, char close){
    std::string out(1, open);
    bool first = true;
    for(auto& e : elems){ if(!first) out += ' '; first = false; out += to_string(e); }
    out += close;
    return out;
}

} // namespace

form_ptr parse(std::string_view input, const std::string& source_name){
    pegtl::memory_input<> in(input.data(), input.size(), source_name);
    build_state state;
    try {
        pegtl::parse<grammar::document, action>(in, state);
    } catch(const pegtl::parse_error& e){
        if(!e.positions().empty()){
            const auto& p = e.positions().front();
            throw parse_error(e.what(), (int)p.line, (int)p.column);
        }
        throw parse_error(e.what());
    }
    if(!state.result) throw parse_error("empty input");
    if(detail::env_flag_enabled("TMPLC_DEBUG_TEXT"))
        std::fprintf(stderr, "[dbg][text][parse] source=%s bytes=%zu\n", source_name.c_str(), input.size());
    return state.result;
}

std::string to_string(const form& f){
    struct V {
        std::string operator()(std::monostate) const { return "nil"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { return format_double(d); }
        std::string operator()(const std::string& s) const { return quote(s); }
        std::string operator()(const keyword& k) const { return ':' + k.name; }
        std::string operator()(const symbol& s) const { return s.name; }
        std::string operator()(const list& l) const { return join(l.elems, '(', ')'); }
        std::string operator()(const vector_t& v) const { return join(v.elems, '[', ']'); }
    };
    return std::visit(V{}, f.data);
}

std::string to_pretty_string(const form& f, int indentWidth){
    const size_t MAX_INLINE_LEN = 90;
    auto indentStr = [](int spaces){ return std::string((size_t)std::max(spaces, 0), ' '); };
    auto is_atomic = [](const form& x){ return !as_list(x) && !as_vector(x); };
    auto force_multi = [](const list& l){
        static const char* blockSyms[] = {"job", "view", "host", "listener"};
        if(l.elems.empty()) return false;
        auto* head = as_symbol(*l.elems[0]);
        if(!head) return false;
        for(auto s : blockSyms) if(head->name == s) return true;
        return false;
    };

    std::function<std::string(const form&, int)> pp = [&](const form& x, int indent) -> std::string {
        if(is_atomic(x)) return to_string(x);
        if(auto* v = as_vector(x)){
            if(v->elems.empty()) return "[]";
            bool noBlocks = std::none_of(v->elems.begin(), v->elems.end(), [&](const form_ptr& e){
                auto* l = as_list(*e);
                return l && force_multi(*l);
            });
            if(noBlocks){
                auto flat = to_string(x);
                if(flat.size() + (size_t)indent <= MAX_INLINE_LEN) return flat;
            }
            std::string out = "[";
            for(auto& e : v->elems) out += '\n' + indentStr(indent + indentWidth) + pp(*e, indent + indentWidth);
            out += '\n' + indentStr(indent) + ']';
            return out;
        }
        const auto& elems = as_list(x)->elems;
        if(elems.empty()) return "()";
        if(!force_multi(*as_list(x))){
            auto flat = to_string(x);
            if(flat.size() + (size_t)indent <= MAX_INLINE_LEN) return flat;
        }
        // Header line: head plus leading atoms and keyword/atom pairs. Nested forms go below.
        std::string out = "(" + pp(*elems[0], indent);
        size_t i = 1;
        while(i < elems.size() && is_atomic(*elems[i])){
            if(as_keyword(*elems[i]) && i + 1 < elems.size() && !is_atomic(*elems[i+1])) break;
            out += ' ' + to_string(*elems[i]);
            ++i;
        }
        while(i < elems.size()){
            out += '\n' + indentStr(indent + indentWidth);
            if(as_keyword(*elems[i]) && i + 1 < elems.size()){
                out += to_string(*elems[i]) + ' ' + pp(*elems[i+1], indent + indentWidth);
                i += 2;
            } else {
                out += pp(*elems[i], indent + indentWidth);
                ++i;
            }
        }
        out += ')';
        return out;
    };
    return pp(f, 0);
}

} // namespace tmplc::text
