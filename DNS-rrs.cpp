#include "DNS-rrs.hpp"

#include "DNS-error.hpp"
#include "DNS-iostream.hpp"
#include "DNS-name.hpp"

#include <cstring>
#include <limits>
#include <numeric>
#include <stdexcept>

#include <arpa/inet.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace DNS {

RR_A::RR_A(uint8_t const* rd, size_t sz)
{
  static_assert(sizeof(addr_.sin_addr) == 4);
  CHECK_EQ(sz, sizeof(addr_.sin_addr));
  addr_.sin_family = AF_INET;
  std::memcpy(&addr_.sin_addr, rd, sizeof(addr_.sin_addr));
  PCHECK(inet_ntop(AF_INET, &addr_.sin_addr, str_, sizeof str_));
}

RR_A::RR_A(std::string_view addr)
{
  std::string const str{addr};
  addr_.sin_family = AF_INET;
  if (inet_pton(AF_INET, str.c_str(), &addr_.sin_addr) != 1)
    throw std::invalid_argument(fmt::format("invalid IPv4 address «{}»", addr));
  PCHECK(inet_ntop(AF_INET, &addr_.sin_addr, str_, sizeof str_));
}

RR_AAAA::RR_AAAA(uint8_t const* rd, size_t sz)
{
  static_assert(sizeof(addr_.sin6_addr) == 16);
  CHECK_EQ(sz, sizeof(addr_.sin6_addr));
  addr_.sin6_family = AF_INET6;
  std::memcpy(&addr_.sin6_addr, rd, sizeof(addr_.sin6_addr));
  PCHECK(inet_ntop(AF_INET6, &addr_.sin6_addr, str_, sizeof str_));
}

RR_AAAA::RR_AAAA(std::string_view addr)
{
  std::string const str{addr};
  addr_.sin6_family = AF_INET6;
  if (inet_pton(AF_INET6, str.c_str(), &addr_.sin6_addr) != 1)
    throw std::invalid_argument(fmt::format("invalid IPv6 address «{}»", addr));
  PCHECK(inet_ntop(AF_INET6, &addr_.sin6_addr, str_, sizeof str_));
}

std::string RR_TXT::str() const
{
  return std::accumulate(begin(strings_), end(strings_), std::string{});
}

std::optional<std::string> rname_to_email(std::string_view rname)
{
  std::string local;
  for (auto p = rname.begin(); p != rname.end(); ++p) {
    if (*p == '\\' && (p + 1) != rname.end()) {
      local += *++p;
      continue;
    }
    if (*p == '.') {
      auto const domain = rname.substr(p - rname.begin() + 1);
      if (local.empty() || domain.empty())
        return {};
      return fmt::format("{}@{}", local, domain);
    }
    local += *p;
  }
  return {};
}

std::string email_to_rname(std::string_view email)
{
  auto const at = email.rfind('@');
  if (at == std::string_view::npos)
    return std::string{email};

  std::string rname;
  for (auto const ch : email.substr(0, at)) {
    if (ch == '.' || ch == '\\')
      rname += '\\';
    rname += ch;
  }
  rname += '.';
  rname += email.substr(at + 1);
  return rname;
}

namespace {
void check_internet(RR_type type, RR_class cls)
{
  if (cls != RR_class::IN) {
    throw parse_error(errc::invalid_value,
                      fmt::format("unsupported {} record class {}", type, cls));
  }
}

RR get_A(cursor& rd, RR_class cls)
{
  check_internet(RR_type::A, cls);
  auto const addr = rd.read_bytes(4);
  return RR_A{addr.data(), addr.size()};
}

RR get_AAAA(cursor& rd, RR_class cls)
{
  check_internet(RR_type::AAAA, cls);
  auto const addr = rd.read_bytes(16);
  return RR_AAAA{addr.data(), addr.size()};
}

RR get_MX(cursor& rd)
{
  auto const preference = rd.read_u16();
  return RR_MX{read_name(rd), preference};
}

RR get_SOA(cursor& rd)
{
  auto mname = read_name(rd);
  auto rname = read_name(rd);

  auto const serial  = rd.read_u32();
  auto const refresh = std::chrono::seconds{rd.read_u32()};
  auto const retry   = std::chrono::seconds{rd.read_u32()};
  auto const expire  = std::chrono::seconds{rd.read_u32()};
  auto const minimum = std::chrono::seconds{rd.read_u32()};

  auto email = rname_to_email(rname);
  if (!email) {
    VLOG(1) << "SOA rname «" << rname << "» is not a mailbox";
  }

  return RR_SOA{std::move(mname),
                email ? std::move(*email) : std::move(rname),
                serial,
                refresh,
                retry,
                expire,
                minimum};
}

RR get_SRV(cursor& rd)
{
  auto const priority = rd.read_u16();
  auto const weight   = rd.read_u16();
  auto const port     = rd.read_u16();
  return RR_SRV{priority, weight, port, read_name(rd)};
}

RR get_TXT(cursor& rd)
{
  std::vector<std::string> strings;
  while (rd.remaining()) {
    auto const len = rd.read_u8();
    auto const str = rd.read_bytes(len);
    strings.emplace_back(reinterpret_cast<char const*>(str.data()), str.size());
  }
  return RR_TXT{std::move(strings)};
}

RR get_rr(cursor& rd, RR_type type, RR_class cls)
{
  switch (type) { // clang-format off
  case RR_type::A:     return get_A   (rd, cls);
  case RR_type::NS:    return RR_NS   {read_name(rd)};
  case RR_type::CNAME: return RR_CNAME{read_name(rd)};
  case RR_type::SOA:   return get_SOA (rd);
  case RR_type::PTR:   return RR_PTR  {read_name(rd)};
  case RR_type::MX:    return get_MX  (rd);
  case RR_type::TXT:   return get_TXT (rd);
  case RR_type::AAAA:  return get_AAAA(rd, cls);
  case RR_type::SRV:   return get_SRV (rd);

  case RR_type::OPT:
    throw parse_error(errc::structure,
                      "OPT pseudo-record outside the additional section");

  case RR_type::Reserved:
  case RR_type::ANY:
    break;
  } // clang-format on

  throw parse_error(errc::invalid_value,
                    fmt::format("{} is only valid as a question type", type));
}

// RDATA writers

void put_rdata(iobuffer<octet>& out, RR_A const& rr, RR_class cls)
{
  if (cls != RR_class::IN)
    throw encode_error(errc::misuse, fmt::format("A record in class {}", cls));
  out.append(rr.octets().data(), rr.octets().size());
}

void put_rdata(iobuffer<octet>& out, RR_AAAA const& rr, RR_class cls)
{
  if (cls != RR_class::IN)
    throw encode_error(errc::misuse, fmt::format("AAAA record in class {}", cls));
  out.append(rr.octets().data(), rr.octets().size());
}

void put_rdata(iobuffer<octet>& out, RR_NS const& rr, RR_class)
{
  write_name(out, rr.str());
}

void put_rdata(iobuffer<octet>& out, RR_CNAME const& rr, RR_class)
{
  write_name(out, rr.str());
}

void put_rdata(iobuffer<octet>& out, RR_PTR const& rr, RR_class)
{
  write_name(out, rr.str());
}

void put_rdata(iobuffer<octet>& out, RR_MX const& rr, RR_class)
{
  out.put_u16(rr.preference());
  write_name(out, rr.exchange());
}

uint32_t as_u32(std::chrono::seconds secs, char const* what)
{
  if (secs.count() < 0 || secs.count() > std::numeric_limits<uint32_t>::max()) {
    throw encode_error(errc::misuse,
                       fmt::format("{} of {}s does not fit in 32 bits", what,
                                   secs.count()));
  }
  return static_cast<uint32_t>(secs.count());
}

void put_rdata(iobuffer<octet>& out, RR_SOA const& rr, RR_class)
{
  write_name(out, rr.mname());
  write_name(out, email_to_rname(rr.rname()));
  out.put_u32(rr.serial());
  out.put_u32(as_u32(rr.refresh(), "SOA refresh"));
  out.put_u32(as_u32(rr.retry(), "SOA retry"));
  out.put_u32(as_u32(rr.expire(), "SOA expire"));
  out.put_u32(as_u32(rr.minimum(), "SOA minimum"));
}

void put_rdata(iobuffer<octet>& out, RR_SRV const& rr, RR_class)
{
  out.put_u16(rr.priority());
  out.put_u16(rr.weight());
  out.put_u16(rr.port());
  write_name(out, rr.target());
}

void put_rdata(iobuffer<octet>& out, RR_TXT const& rr, RR_class)
{
  for (auto const& str : rr.strings()) {
    if (str.size() > Config::max_char_string_sz) {
      throw encode_error(errc::misuse,
                         fmt::format("TXT string of {} octets, limit is {}",
                                     str.size(), Config::max_char_string_sz));
    }
    out.put_u8(str.size());
    out.append(reinterpret_cast<octet const*>(str.data()), str.size());
  }
}
} // namespace

record parse_record(cursor& cur, std::string name, RR_type type, RR_class cls)
{
  auto const ttl      = cur.read_u32();
  auto const rdlength = cur.read_u16();

  if (rdlength > cur.remaining()) {
    throw parse_error(errc::truncated,
                      fmt::format("{} record RDLENGTH {} but only {} octets "
                                  "left in message",
                                  type, rdlength, cur.remaining()));
  }

  auto rd = cur.window(rdlength);
  auto rr = get_rr(rd, type, cls);

  if (rd.remaining()) {
    throw parse_error(errc::structure,
                      fmt::format("{} record for {} has {} of {} RDATA octets "
                                  "left over",
                                  type, name, rd.remaining(), rdlength));
  }

  cur.skip(rdlength);

  VLOG(2) << name << ' ' << ttl << ' ' << cls << ' ' << type << ' ' << rr;

  return record{std::move(name), cls, std::chrono::seconds{ttl}, std::move(rr)};
}

void write_record(iobuffer<octet>& out, record const& rec)
{
  write_name(out, rec.name);
  out.put_u16(static_cast<uint16_t>(rec.type()));
  out.put_u16(static_cast<uint16_t>(rec.cls));
  out.put_u32(as_u32(rec.ttl, "TTL"));

  auto const rdlength_pos = out.size();
  out.put_u16(0); // patched below

  std::visit([&out, cls = rec.cls](auto const& rr) { put_rdata(out, rr, cls); },
             rec.rr);

  auto const rdlength = out.size() - rdlength_pos - 2;
  if (rdlength > std::numeric_limits<uint16_t>::max()) {
    throw encode_error(errc::misuse,
                       fmt::format("{} record for {} has {} octets of RDATA",
                                   rec.type(), rec.name, rdlength));
  }
  out.set_u16(rdlength_pos, rdlength);
}

} // namespace DNS
