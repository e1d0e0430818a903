#include "DNS-text.hpp"

#include "DNS-iostream.hpp"
#include "esc.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::any;
using tao::pegtl::blank;
using tao::pegtl::eof;
using tao::pegtl::list;
using tao::pegtl::memory_input;
using tao::pegtl::not_one;
using tao::pegtl::nothing;
using tao::pegtl::one;
using tao::pegtl::parse;
using tao::pegtl::plus;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::star;

using tao::pegtl::abnf::DIGIT;

namespace DNS {
namespace {

struct ws : plus<blank> {};
struct opt_ws : star<blank> {};

struct escaped : seq<one<'\\'>, any> {};

// clang-format off
struct word : plus<sor<escaped, not_one<' ', '\t', '"', '\\'>>> {};
struct number : plus<DIGIT> {};

struct quoted_text : star<sor<escaped, not_one<'"', '\\'>>> {};
struct quoted : seq<one<'"'>, quoted_text, one<'"'>> {};

template <typename... Fields>
struct rd : seq<opt_ws, Fields..., opt_ws, eof> {};

struct single_rdata : rd<word> {};
struct MX_rdata     : rd<number, ws, word> {};
struct SOA_rdata    : rd<word, ws, word, ws, number, ws, number,
                         ws, number, ws, number, ws, number> {};
struct SRV_rdata    : rd<number, ws, number, ws, number, ws, word> {};
struct TXT_rdata    : rd<list<sor<quoted, word>, ws>> {};
// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<word> {
  template <typename Input>
  static void apply(Input const& in, std::vector<std::string>& fields)
  {
    fields.push_back(in.string());
  }
};

template <>
struct action<number> {
  template <typename Input>
  static void apply(Input const& in, std::vector<std::string>& fields)
  {
    fields.push_back(in.string());
  }
};

template <>
struct action<quoted_text> {
  template <typename Input>
  static void apply(Input const& in, std::vector<std::string>& fields)
  {
    fields.push_back(in.string());
  }
};

template <typename Grammar>
std::vector<std::string> fields_of(RR_type type, std::string_view text)
{
  std::vector<std::string> fields;
  memory_input<> in{text.data(), text.size(), "rdata"};
  if (!parse<Grammar, action>(in, fields)) {
    throw std::invalid_argument(
        fmt::format("invalid {} RDATA «{}»", type, text));
  }
  return fields;
}

template <typename UInt>
UInt to_uint(std::string const& field)
{
  UInt n{};
  auto const last  = field.data() + field.size();
  auto const [p, ec] = std::from_chars(field.data(), last, n);
  if (ec != std::errc{} || p != last) {
    throw std::invalid_argument(fmt::format("number {} out of range for {} "
                                            "bits",
                                            field,
                                            std::numeric_limits<UInt>::digits));
  }
  return n;
}

std::chrono::seconds to_seconds(std::string const& field)
{
  return std::chrono::seconds{to_uint<uint32_t>(field)};
}

// A final dot escaped with an odd number of backslashes is part of the
// label, not the root.
std::string absolute(std::string name)
{
  if (name.empty() || name == ".")
    return ".";
  if (name.back() == '.') {
    auto const dot  = name.size() - 1;
    auto const last = name.find_last_not_of('\\', dot - 1);
    auto const bs   = (last == std::string::npos) ? dot : dot - 1 - last;
    if (bs % 2 == 0)
      return name;
  }
  name += '.';
  return name;
}

std::string text_of(std::string const& field)
{
  std::string text;
  if (!unesc(field, text)) {
    throw std::invalid_argument(
        fmt::format("bad escape in character-string «{}»", field));
  }
  if (text.size() > Config::max_char_string_sz) {
    throw std::invalid_argument(
        fmt::format("character-string of {} octets, limit is {}", text.size(),
                    Config::max_char_string_sz));
  }
  return text;
}

RR SOA_from(std::vector<std::string> const& fields)
{
  CHECK_EQ(fields.size(), 7u);

  auto rname = absolute(fields[1]);
  if (rname.find('@') == std::string::npos) {
    if (auto email = rname_to_email(rname); email) {
      rname = std::move(*email);
    }
  }

  return RR_SOA{absolute(fields[0]),
                std::move(rname),
                to_uint<uint32_t>(fields[2]),
                to_seconds(fields[3]),
                to_seconds(fields[4]),
                to_seconds(fields[5]),
                to_seconds(fields[6])};
}

RR TXT_from(std::vector<std::string> const& fields)
{
  std::vector<std::string> strings;
  strings.reserve(fields.size());
  for (auto const& field : fields)
    strings.push_back(text_of(field));
  return RR_TXT{std::move(strings)};
}
} // namespace

RR RR_from_string(RR_type type, std::string_view rdata)
{
  switch (type) {
  case RR_type::A: {
    auto const f = fields_of<single_rdata>(type, rdata);
    return RR_A{f[0]};
  }
  case RR_type::AAAA: {
    auto const f = fields_of<single_rdata>(type, rdata);
    return RR_AAAA{f[0]};
  }
  case RR_type::NS:
    return RR_NS{absolute(fields_of<single_rdata>(type, rdata)[0])};
  case RR_type::CNAME:
    return RR_CNAME{absolute(fields_of<single_rdata>(type, rdata)[0])};
  case RR_type::PTR:
    return RR_PTR{absolute(fields_of<single_rdata>(type, rdata)[0])};
  case RR_type::MX: {
    auto const f = fields_of<MX_rdata>(type, rdata);
    return RR_MX{absolute(f[1]), to_uint<uint16_t>(f[0])};
  }
  case RR_type::SOA: return SOA_from(fields_of<SOA_rdata>(type, rdata));
  case RR_type::SRV: {
    auto const f = fields_of<SRV_rdata>(type, rdata);
    return RR_SRV{to_uint<uint16_t>(f[0]), to_uint<uint16_t>(f[1]),
                  to_uint<uint16_t>(f[2]), absolute(f[3])};
  }
  case RR_type::TXT: return TXT_from(fields_of<TXT_rdata>(type, rdata));

  case RR_type::Reserved:
  case RR_type::OPT:
  case RR_type::ANY: break;
  }
  throw std::invalid_argument(fmt::format("{} has no RDATA text form", type));
}

} // namespace DNS
