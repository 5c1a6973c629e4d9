// Generic EDN-shaped forms: the syntax tree of the job text format, with source positions.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "tmplc/errors.hpp"

namespace tmplc::text
{

    struct parse_error : text_error
    {
        parse_error(const std::string &message, int line = -1, int col = -1) : text_error("E0001", message, line, col) {}
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct form;
    using form_ptr = std::shared_ptr<form>;

    struct list
    {
        std::vector<form_ptr> elems;
    };
    struct vector_t
    {
        std::vector<form_ptr> elems;
    };

    using form_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t>;

    struct form
    {
        form_data data;
        int line = -1;
        int col = -1;
    };

    // Parse exactly one form (surrounding whitespace, commas and ';' comments allowed).
    form_ptr parse(std::string_view input, const std::string &source_name = "<memory>");

    std::string to_string(const form &f);
    inline std::string to_string(const form_ptr &p) { return to_string(*p); }
    // Lists headed by job/view/host/listener break one element per line; other forms stay inline when short.
    std::string to_pretty_string(const form &f, int indentWidth = 2);
    inline std::string to_pretty_string(const form_ptr &p, int indentWidth = 2) { return to_pretty_string(*p, indentWidth); }

    inline const list *as_list(const form &f) { return std::get_if<list>(&f.data); }
    inline const vector_t *as_vector(const form &f) { return std::get_if<vector_t>(&f.data); }
    inline const symbol *as_symbol(const form &f) { return std::get_if<symbol>(&f.data); }
    inline const keyword *as_keyword(const form &f) { return std::get_if<keyword>(&f.data); }
    inline bool is_nil(const form &f) { return std::holds_alternative<std::monostate>(f.data); }

    // ------ Factory helpers ------
    inline form_ptr make_form(form_data d) { return std::make_shared<form>(form{std::move(d), -1, -1}); }
    inline form_ptr f_sym(std::string name) { return make_form(symbol{std::move(name)}); }
    inline form_ptr f_kw(std::string name) { return make_form(keyword{std::move(name)}); }
    inline form_ptr f_str(std::string s) { return make_form(form_data{std::in_place_type<std::string>, std::move(s)}); }
    inline form_ptr f_i64(int64_t v) { return make_form(form_data{std::in_place_type<int64_t>, v}); }
    inline form_ptr f_f64(double v) { return make_form(form_data{std::in_place_type<double>, v}); }
    inline form_ptr f_bool(bool b) { return make_form(form_data{std::in_place_type<bool>, b}); }
    inline form_ptr f_nil() { return make_form(std::monostate{}); }
    inline form_ptr f_list(std::vector<form_ptr> xs) { return make_form(list{std::move(xs)}); }
    inline form_ptr f_vec(std::vector<form_ptr> xs) { return make_form(vector_t{std::move(xs)}); }

} // namespace tmplc::text
