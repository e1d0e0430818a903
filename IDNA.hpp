#ifndef IDNA_DOT_HPP
#define IDNA_DOT_HPP

#include <string>
#include <string_view>

// Internationalized domain names: conversion between U-labels (UTF-8)
// and A-labels ("xn--" punycode). Failures throw std::invalid_argument.

namespace IDNA {

constexpr char ace_prefix[] = "xn--";

constexpr bool is_ascii(std::string_view str) noexcept
{
  for (auto ch : str) {
    if ((static_cast<unsigned char>(ch) & 0x80) != 0)
      return false;
  }
  return true;
}

// Normalization Form KC (NFKC) Compatibility Decomposition, followed
// by Canonical Composition, see <http://unicode.org/reports/tr15/>
std::string nfkc(std::string_view str);

// Both of these take a domain with or without a trailing dot and
// return one without.
std::string to_ascii(std::string_view domain);
std::string to_unicode(std::string_view domain);

} // namespace IDNA

#endif // IDNA_DOT_HPP
