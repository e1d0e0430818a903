#ifndef DNS_TYPES_DOT_HPP
#define DNS_TYPES_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Config {
auto constexpr max_udp_sz{uint16_t(4 * 1024)};

// RFC-1035 Section 2.3.4. Size limits
auto constexpr max_label_sz{size_t(63)};
auto constexpr max_name_sz{size_t(255)};
auto constexpr max_char_string_sz{size_t(255)};
} // namespace Config

namespace DNS {

using octet = unsigned char;

enum class RR_type : uint16_t {
  Reserved = 0,

  // RFC 1035 section 3.2.2 “TYPE values”
  A     = 1,
  NS    = 2,
  CNAME = 5,
  SOA   = 6,
  PTR   = 12,
  MX    = 15,
  TXT   = 16,

  // RFC 3596 section 2.1 “AAAA record type”
  AAAA = 28,

  // RFC 2782 Service locator
  SRV = 33,

  // RFC 6891 EDNS(0) OPT pseudo-RR
  OPT = 41,

  // RFC 1035 section 3.2.3 “QTYPE values”, only valid in a question
  ANY = 255,
};

enum class RR_class : uint16_t {
  Reserved = 0, // RFC 6895
  IN       = 1, // the Internet
  CS       = 2, // CSNET, obsolete
  CH       = 3, // Chaos
  HS       = 4, // Hesiod
  NONE     = 254, // RFC 2136
  ANY      = 255, // “*”
};

// <https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-5>
enum class opcode : uint8_t {
  QUERY  = 0,
  IQUERY = 1, // RFC 3425, obsolete
  STATUS = 2,
  NOTIFY = 4, // RFC 1996
  UPDATE = 5, // RFC 2136
  DSO    = 6, // RFC 8490
};

// The header carries only the low four bits, EDNS(0) extends this to
// twelve.
enum class rcode : uint8_t {
  NOERROR   = 0,
  FORMERR   = 1,
  SERVFAIL  = 2,
  NXDOMAIN  = 3,
  NOTIMP    = 4,
  REFUSED   = 5,
  YXDOMAIN  = 6,  // RFC 2136, RFC 6672
  YXRRSET   = 7,  // RFC 2136
  NXRRSET   = 8,  // RFC 2136
  NOTAUTH   = 9,  // RFC 2136, RFC 2845
  NOTZONE   = 10, // RFC 2136
  DSOTYPENI = 11, // RFC 8490
};

constexpr char const* RR_type_c_str(RR_type type)
{
  switch (type) { // clang-format off
  case RR_type::Reserved: return "Reserved";
  case RR_type::A:        return "A";
  case RR_type::NS:       return "NS";
  case RR_type::CNAME:    return "CNAME";
  case RR_type::SOA:      return "SOA";
  case RR_type::PTR:      return "PTR";
  case RR_type::MX:       return "MX";
  case RR_type::TXT:      return "TXT";
  case RR_type::AAAA:     return "AAAA";
  case RR_type::SRV:      return "SRV";
  case RR_type::OPT:      return "OPT";
  case RR_type::ANY:      return "ANY";
  } // clang-format on
  return "*** unknown RR_type ***";
}

constexpr char const* RR_class_c_str(RR_class cls)
{
  switch (cls) { // clang-format off
  case RR_class::Reserved: return "Reserved";
  case RR_class::IN:       return "IN";
  case RR_class::CS:       return "CS";
  case RR_class::CH:       return "CH";
  case RR_class::HS:       return "HS";
  case RR_class::NONE:     return "NONE";
  case RR_class::ANY:      return "*";
  } // clang-format on
  return "*** unknown RR_class ***";
}

constexpr char const* opcode_c_str(opcode op)
{
  switch (op) { // clang-format off
  case opcode::QUERY:  return "QUERY";
  case opcode::IQUERY: return "IQUERY";
  case opcode::STATUS: return "STATUS";
  case opcode::NOTIFY: return "NOTIFY";
  case opcode::UPDATE: return "UPDATE";
  case opcode::DSO:    return "DSO";
  } // clang-format on
  return "*** unknown opcode ***";
}

constexpr char const* rcode_c_str(rcode rc)
{
  switch (rc) { // clang-format off
  case rcode::NOERROR:   return "NOERROR";
  case rcode::FORMERR:   return "FORMERR";
  case rcode::SERVFAIL:  return "SERVFAIL";
  case rcode::NXDOMAIN:  return "NXDOMAIN";
  case rcode::NOTIMP:    return "NOTIMP";
  case rcode::REFUSED:   return "REFUSED";
  case rcode::YXDOMAIN:  return "YXDOMAIN";
  case rcode::YXRRSET:   return "YXRRSET";
  case rcode::NXRRSET:   return "NXRRSET";
  case rcode::NOTAUTH:   return "NOTAUTH";
  case rcode::NOTZONE:   return "NOTZONE";
  case rcode::DSOTYPENI: return "DSOTYPENI";
  } // clang-format on
  return "*** unknown rcode ***";
}

// Description of a full (extended) rcode value, 0 through 4095.
constexpr char const* rcode_desc_c_str(uint16_t rcode)
{
  // https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-6
  switch (rcode) { // clang-format off
  case 0:  return "no error";                           // [RFC1035]
  case 1:  return "format error";                       // [RFC1035]
  case 2:  return "server failure";                     // [RFC1035]
  case 3:  return "non-existent domain";                // [RFC1035]
  case 4:  return "not implemented";                    // [RFC1035]
  case 5:  return "query Refused";                      // [RFC1035]
  case 6:  return "name exists when it should not";     // [RFC2136][RFC6672]
  case 7:  return "RR set exists when it should not";   // [RFC2136]
  case 8:  return "RR set that should exist does not";  // [RFC2136]
  case 9:  return "server not authoritative for zone or not authorized"; // [RFC2136 & RFC2845]
  case 10: return "name not contained in zone";         // [RFC2136]
  case 11: return "DSO-TYPE not implemented";           // [RFC8490]
  case 12: return "unassigned-12";
  case 13: return "unassigned-13";
  case 14: return "unassigned-14";
  case 15: return "unassigned-15";
  case 16: return "bad OPT version or TSIG signature failure"; // [RFC6891 & RFC2845]
  case 17: return "key not recognized";                 // [RFC2845]
  case 18: return "signature out of time window";       // [RFC2845]
  case 19: return "bad TKEY mode";                      // [RFC2930]
  case 20: return "duplicate key name";                 // [RFC2930]
  case 21: return "algorithm not supported";            // [RFC2930]
  case 22: return "bad truncation";                     // [RFC4635]
  case 23: return "bad/missing server cookie";          // [RFC7873]
  } // clang-format on
  if ((24 <= rcode) && (rcode <= 3840)) {
    return "unassigned-24-3840";
  }
  if ((3841 <= rcode) && (rcode <= 4095)) {
    return "reserved for private use"; // [RFC6895]
  }
  return "*** rcode out of range ***";
}

// Partial functions from the wire integer to the enumeration, nothing
// for an unassigned code.

std::optional<RR_type>  RR_type_from_u16(uint16_t n);
std::optional<RR_class> RR_class_from_u16(uint16_t n);
std::optional<opcode>   opcode_from_u8(uint8_t n);
std::optional<rcode>    rcode_from_u8(uint8_t n);

// And from the mnemonics above, case insensitive.

std::optional<RR_type>  RR_type_from_string(std::string_view str);
std::optional<RR_class> RR_class_from_string(std::string_view str);

} // namespace DNS

#endif // DNS_TYPES_DOT_HPP
