#ifndef DNS_RRS_DOT_HPP
#define DNS_RRS_DOT_HPP

#include <chrono>
#include <cstddef>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <netinet/in.h>

#include "DNS-cursor.hpp"
#include "DNS-types.hpp"
#include "iobuffer.hpp"

namespace DNS {

class RR_A {
public:
  RR_A(uint8_t const* rd, size_t sz);
  explicit RR_A(std::string_view addr);

  char const*        c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::A; }

  std::span<octet const, 4> octets() const
  {
    return std::span<octet const, 4>{
        reinterpret_cast<octet const*>(&addr_.sin_addr), 4};
  }

  bool operator==(RR_A const& rhs) const { return strcmp(str_, rhs.str_) == 0; }

private:
  sockaddr_in addr_{};
  char        str_[INET_ADDRSTRLEN];
};

class RR_NS {
public:
  explicit RR_NS(std::string nsdname)
    : nsdname_(std::move(nsdname))
  {
  }

  std::string const&       str() const { return nsdname_; }
  char const*              c_str() const { return str().c_str(); }
  constexpr static RR_type rr_type() { return RR_type::NS; }

  bool operator==(RR_NS const& rhs) const { return str() == rhs.str(); }

private:
  std::string nsdname_;
};

class RR_CNAME {
public:
  explicit RR_CNAME(std::string cname)
    : cname_(std::move(cname))
  {
  }

  std::string const&       str() const { return cname_; }
  char const*              c_str() const { return str().c_str(); }
  constexpr static RR_type rr_type() { return RR_type::CNAME; }

  bool operator==(RR_CNAME const& rhs) const { return str() == rhs.str(); }

private:
  std::string cname_;
};

// RFC 2181 section 10.2 PTR records
class RR_PTR {
public:
  explicit RR_PTR(std::string ptrdname)
    : ptrdname_(std::move(ptrdname))
  {
  }

  std::string const&       str() const { return ptrdname_; }
  char const*              c_str() const { return str().c_str(); }
  constexpr static RR_type rr_type() { return RR_type::PTR; }

  bool operator==(RR_PTR const& rhs) const { return str() == rhs.str(); }

private:
  std::string ptrdname_;
};

class RR_MX {
public:
  RR_MX(std::string exchange, uint16_t preference)
    : exchange_(std::move(exchange))
    , preference_(preference)
  {
  }

  std::string const& exchange() const { return exchange_; }
  uint16_t           preference() const { return preference_; }

  constexpr static RR_type rr_type() { return RR_type::MX; }

  bool operator==(RR_MX const& rhs) const
  {
    return (preference() == rhs.preference()) && (exchange() == rhs.exchange());
  }

private:
  std::string exchange_;
  uint16_t    preference_;
};

/*
  RFC 1035 section 3.3.13. SOA RDATA format

  The RNAME is kept as a mailbox, "hostmaster@example.com." rather than
  the "hostmaster.example.com." found on the wire.
*/

class RR_SOA {
public:
  RR_SOA(std::string          mname,
         std::string          rname,
         uint32_t             serial,
         std::chrono::seconds refresh,
         std::chrono::seconds retry,
         std::chrono::seconds expire,
         std::chrono::seconds minimum)
    : mname_(std::move(mname))
    , rname_(std::move(rname))
    , serial_(serial)
    , refresh_(refresh)
    , retry_(retry)
    , expire_(expire)
    , minimum_(minimum)
  {
  }

  std::string const&   mname() const { return mname_; }
  std::string const&   rname() const { return rname_; }
  uint32_t             serial() const { return serial_; }
  std::chrono::seconds refresh() const { return refresh_; }
  std::chrono::seconds retry() const { return retry_; }
  std::chrono::seconds expire() const { return expire_; }
  std::chrono::seconds minimum() const { return minimum_; }

  constexpr static RR_type rr_type() { return RR_type::SOA; }

  bool operator==(RR_SOA const& rhs) const
  {
    return (mname() == rhs.mname()) && (rname() == rhs.rname()) &&
           (serial() == rhs.serial()) && (refresh() == rhs.refresh()) &&
           (retry() == rhs.retry()) && (expire() == rhs.expire()) &&
           (minimum() == rhs.minimum());
  }

private:
  std::string mname_;
  std::string rname_;

  uint32_t serial_;

  std::chrono::seconds refresh_;
  std::chrono::seconds retry_;
  std::chrono::seconds expire_;
  std::chrono::seconds minimum_;
};

// RFC 2782 A DNS RR for specifying the location of services (DNS SRV)
class RR_SRV {
public:
  RR_SRV(uint16_t priority, uint16_t weight, uint16_t port, std::string target)
    : target_(std::move(target))
    , priority_(priority)
    , weight_(weight)
    , port_(port)
  {
  }

  std::string const& target() const { return target_; }
  uint16_t           priority() const { return priority_; }
  uint16_t           weight() const { return weight_; }
  uint16_t           port() const { return port_; }

  constexpr static RR_type rr_type() { return RR_type::SRV; }

  bool operator==(RR_SRV const& rhs) const
  {
    return (priority() == rhs.priority()) && (weight() == rhs.weight()) &&
           (port() == rhs.port()) && (target() == rhs.target());
  }

private:
  std::string target_;
  uint16_t    priority_;
  uint16_t    weight_;
  uint16_t    port_;
};

// Each of the <character-string>s is opaque, they need not be UTF-8.
class RR_TXT {
public:
  explicit RR_TXT(std::vector<std::string> strings)
    : strings_(std::move(strings))
  {
  }
  explicit RR_TXT(std::string txt_data)
    : strings_{std::move(txt_data)}
  {
  }

  std::vector<std::string> const& strings() const { return strings_; }

  // RFC 7208 section 3.3, the strings concatenated without spaces
  std::string str() const;

  constexpr static RR_type rr_type() { return RR_type::TXT; }

  bool operator==(RR_TXT const& rhs) const { return strings() == rhs.strings(); }

private:
  std::vector<std::string> strings_;
};

class RR_AAAA {
public:
  RR_AAAA(uint8_t const* rd, size_t sz);
  explicit RR_AAAA(std::string_view addr);

  char const*         c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::AAAA; }

  std::span<octet const, 16> octets() const
  {
    return std::span<octet const, 16>{
        reinterpret_cast<octet const*>(&addr_.sin6_addr), 16};
  }

  bool operator==(RR_AAAA const& rhs) const
  {
    return strcmp(c_str(), rhs.c_str()) == 0;
  }

private:
  sockaddr_in6 addr_{};
  char         str_[INET6_ADDRSTRLEN];
};

using RR = std::variant<RR_A,
                        RR_NS,
                        RR_CNAME,
                        RR_SOA,
                        RR_PTR,
                        RR_MX,
                        RR_TXT,
                        RR_AAAA,
                        RR_SRV>;

inline RR_type rr_type(RR const& rr)
{
  return std::visit([](auto const& r) { return r.rr_type(); }, rr);
}

// RFC 1035 section 4.1.2. Question section format
struct question {
  std::string name;
  RR_type     type{RR_type::A};
  RR_class    cls{RR_class::IN};

  bool operator==(question const& rhs) const = default;
};

// RFC 1035 section 4.1.3. Resource record format
struct record {
  std::string          name;
  RR_class             cls{RR_class::IN};
  std::chrono::seconds ttl{0};
  RR                   rr;

  RR_type type() const { return rr_type(rr); }

  bool operator==(record const& rhs) const = default;
};

// "username.example.com" ⇔ "username@example.com"
// "Action\.domains.ISI.EDU" ⇔ "Action.domains@ISI.EDU"
//
// The first unescaped dot becomes the '@', nothing if there isn't one
// with a label after it.
std::optional<std::string> rname_to_email(std::string_view rname);
std::string                email_to_rname(std::string_view email);

// Resource codec: the RDATA of one record, and the TTL, RDLENGTH and
// RDATA that follow its NAME, TYPE and CLASS. OPT is not handled here.

record parse_record(cursor& cur, std::string name, RR_type type, RR_class cls);

void write_record(iobuffer<octet>& out, record const& rec);

} // namespace DNS

#endif // DNS_RRS_DOT_HPP
