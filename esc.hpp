#ifndef ESC_DOT_HPP
#define ESC_DOT_HPP

#include <string>
#include <string_view>

// c:           "\n", "\t", "\xa0" and friends, for log messages.
// master_file: RFC 1035 section 5.1, "\"", "\\" and "\DDD" decimal
//              escapes, for <character-string>s in text form.
enum class esc_style : bool { c, master_file };

std::string esc(std::string_view str, esc_style style = esc_style::c);

// Undo esc_style::master_file, nothing if str has a bad escape.
bool unesc(std::string_view str, std::string& out);

#endif // ESC_DOT_HPP
