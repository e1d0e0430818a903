#ifndef DNS_IOSTREAM_DOT_HPP
#define DNS_IOSTREAM_DOT_HPP

#include "DNS-error.hpp"
#include "DNS-rrs.hpp"
#include "DNS-types.hpp"
#include "esc.hpp"

#include <iostream>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace DNS {

// RDATA in the text form used by zone files and dig.

inline std::ostream& operator<<(std::ostream& os, RR_A const& rr_a)
{
  return os << rr_a.c_str();
}

inline std::ostream& operator<<(std::ostream& os, RR_NS const& rr_ns)
{
  return os << rr_ns.str();
}

inline std::ostream& operator<<(std::ostream& os, RR_CNAME const& rr_c)
{
  return os << rr_c.str();
}

inline std::ostream& operator<<(std::ostream& os, RR_PTR const& rr_ptr)
{
  return os << rr_ptr.str();
}

inline std::ostream& operator<<(std::ostream& os, RR_MX const& rr_mx)
{
  return os << rr_mx.preference() << ' ' << rr_mx.exchange();
}

// "ns1.google.com. dns-admin@google.com. 376337657 900 900 1800 60"
inline std::ostream& operator<<(std::ostream& os, RR_SOA const& rr_soa)
{
  return os << rr_soa.mname() << ' ' << rr_soa.rname() << ' '
            << rr_soa.serial() << ' ' << rr_soa.refresh().count() << ' '
            << rr_soa.retry().count() << ' ' << rr_soa.expire().count() << ' '
            << rr_soa.minimum().count();
}

// "5 0 389 ldap.google.com."
inline std::ostream& operator<<(std::ostream& os, RR_SRV const& rr_srv)
{
  return os << rr_srv.priority() << ' ' << rr_srv.weight() << ' '
            << rr_srv.port() << ' ' << rr_srv.target();
}

inline std::ostream& operator<<(std::ostream& os, RR_TXT const& rr_txt)
{
  auto sep = "";
  for (auto const& str : rr_txt.strings()) {
    os << sep << '"' << esc(str, esc_style::master_file) << '"';
    sep = " ";
  }
  return os;
}

inline std::ostream& operator<<(std::ostream& os, RR_AAAA const& rr_aaaa)
{
  return os << rr_aaaa.c_str();
}

inline std::ostream& operator<<(std::ostream& os, RR const& rr)
{
  std::visit([&os](auto const& arg) { os << arg; }, rr);
  return os;
}

inline std::ostream& operator<<(std::ostream& os, RR_type const& type)
{
  return os << RR_type_c_str(type);
}

inline std::ostream& operator<<(std::ostream& os, RR_class const& cls)
{
  return os << RR_class_c_str(cls);
}

inline std::ostream& operator<<(std::ostream& os, opcode const& op)
{
  return os << opcode_c_str(op);
}

inline std::ostream& operator<<(std::ostream& os, rcode const& rc)
{
  return os << rcode_c_str(rc);
}

inline std::ostream& operator<<(std::ostream& os, errc const& e)
{
  return os << errc_c_str(e);
}

inline std::ostream& operator<<(std::ostream& os, question const& q)
{
  return os << q.name << ' ' << q.cls << ' ' << q.type;
}

inline std::ostream& operator<<(std::ostream& os, record const& rec)
{
  return os << rec.name << ' ' << rec.ttl.count() << ' ' << rec.cls << ' '
            << rec.type() << ' ' << rec.rr;
}

} // namespace DNS

template <>
struct fmt::formatter<DNS::RR_type> : ostream_formatter {};
template <>
struct fmt::formatter<DNS::RR_class> : ostream_formatter {};
template <>
struct fmt::formatter<DNS::opcode> : ostream_formatter {};
template <>
struct fmt::formatter<DNS::rcode> : ostream_formatter {};
template <>
struct fmt::formatter<DNS::RR> : ostream_formatter {};
template <>
struct fmt::formatter<DNS::record> : ostream_formatter {};
template <>
struct fmt::formatter<DNS::question> : ostream_formatter {};

#endif // DNS_IOSTREAM_DOT_HPP
