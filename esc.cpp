#include "esc.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace {
bool needs_esc(unsigned char c, esc_style style)
{
  if (style == esc_style::master_file)
    return (!std::isprint(c)) || (c == '\\') || (c == '"');
  return (!std::isprint(c)) || (c == '\\');
}

void esc_c(std::string& ret, char c)
{
  switch (c) {
  case '\a': ret += "\\a"; break;
  case '\b': ret += "\\b"; break;
  case '\f': ret += "\\f"; break;
  case '\n': ret += "\\n"; break;
  case '\r': ret += "\\r"; break;
  case '\t': ret += "\\t"; break;
  case '\v': ret += "\\v"; break;
  case '\\': ret += "\\\\"; break;
  default:
    ret += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
  }
}

void esc_master_file(std::string& ret, char c)
{
  auto const uc = static_cast<unsigned char>(c);
  if (std::isprint(uc)) {
    ret += '\\';
    ret += c;
  }
  else {
    ret += fmt::format("\\{:03d}", uc);
  }
}
} // namespace

std::string esc(std::string_view str, esc_style style)
{
  auto nesc{std::count_if(begin(str), end(str), [style](unsigned char c) {
    return needs_esc(c, style);
  })};
  if (!nesc)
    return std::string(str);
  std::string ret;
  ret.reserve(str.length() + 3 * nesc);
  for (auto c : str) {
    if (!needs_esc(static_cast<unsigned char>(c), style)) {
      ret += c;
      continue;
    }
    if (style == esc_style::master_file)
      esc_master_file(ret, c);
    else
      esc_c(ret, c);
  }
  return ret;
}

bool unesc(std::string_view str, std::string& out)
{
  out.clear();
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] != '\\') {
      out += str[i];
      continue;
    }
    if (++i == str.size())
      return false;
    if (std::isdigit(static_cast<unsigned char>(str[i]))) {
      if (i + 3 > str.size())
        return false;
      unsigned val = 0;
      for (auto j = i; j < i + 3; ++j) {
        if (!std::isdigit(static_cast<unsigned char>(str[j])))
          return false;
        val = val * 10 + (str[j] - '0');
      }
      if (val > 255)
        return false;
      out += static_cast<char>(val);
      i += 2;
      continue;
    }
    out += str[i];
  }
  return true;
}
