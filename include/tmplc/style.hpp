// String helpers for generated identifiers and style/class binding names.
#pragma once
#include <string>
#include <string_view>

namespace tmplc {

// Replace every character outside [A-Za-z0-9_] with '_' (one '_' per UTF-8 code point).
std::string sanitize_identifier(std::string_view name);

// camelCase -> kebab-case: "fontSize" -> "font-size".
std::string hyphenate(std::string_view name);

// Hyphenate unless `name` is a CSS custom property ("--my-var").
std::string normalize_style_prop_name(std::string_view name);

// Truncate at the first "!important", dropping the marker and everything after it.
std::string strip_important(std::string_view name);

} // namespace tmplc
