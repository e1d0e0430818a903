#include "DNS-types.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace {
template <typename E, typename U>
std::optional<E> checked(U n, std::initializer_list<E> known)
{
  for (auto const e : known) {
    if (static_cast<U>(e) == n)
      return e;
  }
  return {};
}

template <typename E, typename F>
std::optional<E>
from_mnemonic(std::string_view str, F c_str, std::initializer_list<E> known)
{
  for (auto const e : known) {
    if (boost::algorithm::iequals(str, std::string_view{c_str(e)}))
      return e;
  }
  return {};
}

constexpr std::initializer_list<DNS::RR_type> all_types{
    DNS::RR_type::Reserved, DNS::RR_type::A,    DNS::RR_type::NS,
    DNS::RR_type::CNAME,    DNS::RR_type::SOA,  DNS::RR_type::PTR,
    DNS::RR_type::MX,       DNS::RR_type::TXT,  DNS::RR_type::AAAA,
    DNS::RR_type::SRV,      DNS::RR_type::OPT,  DNS::RR_type::ANY,
};

constexpr std::initializer_list<DNS::RR_class> all_classes{
    DNS::RR_class::Reserved, DNS::RR_class::IN,   DNS::RR_class::CS,
    DNS::RR_class::CH,       DNS::RR_class::HS,   DNS::RR_class::NONE,
    DNS::RR_class::ANY,
};
} // namespace

namespace DNS {

std::optional<RR_type> RR_type_from_u16(uint16_t n)
{
  return checked<RR_type>(n, all_types);
}

std::optional<RR_class> RR_class_from_u16(uint16_t n)
{
  return checked<RR_class>(n, all_classes);
}

std::optional<opcode> opcode_from_u8(uint8_t n)
{
  return checked<opcode>(n, {
                                opcode::QUERY,
                                opcode::IQUERY,
                                opcode::STATUS,
                                opcode::NOTIFY,
                                opcode::UPDATE,
                                opcode::DSO,
                            });
}

std::optional<rcode> rcode_from_u8(uint8_t n)
{
  return checked<rcode>(n, {
                               rcode::NOERROR,
                               rcode::FORMERR,
                               rcode::SERVFAIL,
                               rcode::NXDOMAIN,
                               rcode::NOTIMP,
                               rcode::REFUSED,
                               rcode::YXDOMAIN,
                               rcode::YXRRSET,
                               rcode::NXRRSET,
                               rcode::NOTAUTH,
                               rcode::NOTZONE,
                               rcode::DSOTYPENI,
                           });
}

std::optional<RR_type> RR_type_from_string(std::string_view str)
{
  return from_mnemonic<RR_type>(
      str, [](RR_type t) { return RR_type_c_str(t); }, all_types);
}

std::optional<RR_class> RR_class_from_string(std::string_view str)
{
  if (boost::algorithm::iequals(str, "ANY"))
    return RR_class::ANY;
  return from_mnemonic<RR_class>(
      str, [](RR_class c) { return RR_class_c_str(c); }, all_classes);
}

} // namespace DNS
