#include "IDNA.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>

#include <idn2.h>
#include <uninorm.h>

#include <glog/logging.h>

namespace {
std::string_view remove_trailing_dot(std::string_view dom)
{
  if (!dom.empty() && dom.back() == '.')
    dom.remove_suffix(1);
  return dom;
}

struct idn2_deleter {
  void operator()(char* p) const { idn2_free(p); }
};
using idn2_ptr = std::unique_ptr<char, idn2_deleter>;
} // namespace

namespace IDNA {

std::string nfkc(std::string_view str)
{
  if (str.empty())
    return std::string{};

  size_t     length = 0;
  auto const udata  = reinterpret_cast<uint8_t const*>(str.data());
  auto const norm = u8_normalize(UNINORM_NFKC, udata, str.size(), nullptr, &length);
  if (norm == nullptr)
    throw std::invalid_argument("failed to normalize domain");
  std::string ret{reinterpret_cast<char const*>(norm), length};
  free(norm);
  return ret;
}

std::string to_ascii(std::string_view domain)
{
  domain = remove_trailing_dot(domain);
  if (domain.empty())
    return std::string{};

  auto const norm = nfkc(domain);

  // idn2_to_ascii_8z() converts (ASCII) to lower case

  char* ptr  = nullptr;
  auto  code = idn2_to_ascii_8z(norm.c_str(), &ptr, IDN2_TRANSITIONAL);
  idn2_ptr ascii{ptr};
  if (code != IDN2_OK)
    throw std::invalid_argument(idn2_strerror(code));

  VLOG(2) << "to_ascii «" << domain << "» → «" << ascii.get() << "»";
  return std::string{ascii.get()};
}

std::string to_unicode(std::string_view domain)
{
  domain = remove_trailing_dot(domain);
  if (domain.empty())
    return std::string{};

  std::string const ascii{domain};

  char* ptr  = nullptr;
  auto  code = idn2_to_unicode_8z8z(ascii.c_str(), &ptr, IDN2_TRANSITIONAL);
  idn2_ptr utf8{ptr};
  if (code != IDN2_OK)
    throw std::invalid_argument(idn2_strerror(code));

  return std::string{utf8.get()};
}

} // namespace IDNA
