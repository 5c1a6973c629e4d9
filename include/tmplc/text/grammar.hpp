#pragma once
#include <tao/pegtl.hpp>

namespace tmplc::text::grammar {
using namespace tao::pegtl;

// Whitespace, commas and line comments separate forms.
struct comment : seq< one<';'>, until< eolf > > {};
struct separator : sor< space, one<','>, comment > {};
struct separators : star< separator > {};

struct symbol_first : sor< alpha, one<'*','!','_','?','-','+','/','<','>','=','$','%','&','@'> > {};
struct symbol_rest : sor< symbol_first, digit, one<'.','#'> > {};
struct symbol_tok : seq< symbol_first, star< symbol_rest > > {};
struct keyword_tok : seq< one<':'>, plus< symbol_rest > > {};

struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > {};
struct fraction : seq< one<'.'>, star< digit > > {};
struct number_tok : seq< opt< one<'+','-'> >, plus< digit >, opt< fraction >, opt< exponent > > {};
// ##Inf ##-Inf ##NaN
struct special_float_tok : seq< string<'#','#'>, sor< string<'I','n','f'>, string<'-','I','n','f'>, string<'N','a','N'> > > {};

struct escaped : seq< one<'\\'>, any > {};
struct string_char : sor< escaped, not_one<'"','\\'> > {};
struct string_body : star< string_char > {};
struct string_tok : seq< one<'"'>, string_body, must< one<'"'> > > {};

struct value;
struct list_open : one<'('> {};
struct list_close : one<')'> {};
struct vector_open : one<'['> {};
struct vector_close : one<']'> {};
struct list_form : seq< list_open, separators, star< value, separators >, must< list_close > > {};
struct vector_form : seq< vector_open, separators, star< value, separators >, must< vector_close > > {};

// number before symbol: "-1" is a number, "-" and "-x" are symbols.
struct value : sor< list_form, vector_form, string_tok, special_float_tok, number_tok, keyword_tok, symbol_tok > {};

struct document : must< separators, value, separators, eof > {};

} // namespace tmplc::text::grammar
