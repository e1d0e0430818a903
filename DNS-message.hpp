#ifndef DNS_MESSAGE_DOT_HPP
#define DNS_MESSAGE_DOT_HPP

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "DNS-rrs.hpp"
#include "DNS-types.hpp"

#include "iobuffer.hpp"

namespace DNS {

using container_t = iobuffer<octet>;

// Where a new message gets its ID.
using id_source = std::function<uint16_t()>;

// From the process-wide random number generator.
uint16_t random_id();

// EDNS(0), <https://tools.ietf.org/html/rfc6891>
struct extension {
  uint16_t payload_size{Config::max_udp_sz};
  uint8_t  extended_rcode{0};
  uint8_t  version{0};
  bool     dnssec_ok{false}; // RFC 3225

  bool operator==(extension const& rhs) const = default;
};

// A whole DNS message, RFC 1035 section 4.1.

struct message {
  // A query with no questions: id from ids, recursion desired.
  explicit message(id_source const& ids);

  // All zero: what decode() starts from.
  message() = default;

  uint16_t id{0};

  bool qr{false}; // response
  bool aa{false}; // authoritative answer
  bool tc{false}; // truncation
  bool rd{false}; // recursion desired
  bool ra{false}; // recursion available
  bool z{false};  // reserved, must be zero
  bool ad{false}; // authentic data, RFC 4035
  bool cd{false}; // checking disabled, RFC 4035

  opcode op{opcode::QUERY};
  rcode  rc{rcode::NOERROR};

  std::vector<question> questions;
  std::vector<record>   answers;
  std::vector<record>   authority;
  std::vector<record>   additional;

  std::optional<extension> ext;

  // Normalizes domain through IDNA, to A-labels and back, so it
  // compares equal to the name that comes back in a response.
  void add_question(std::string_view domain, RR_type type, RR_class cls);

  void add_extension(extension const& e) { ext = e; }

  // The twelve bit RCODE, with the upper eight from the EDNS(0)
  // extension if there is one.
  uint16_t full_rcode() const;

  bool operator==(message const& rhs) const = default;
};

// The wire form, RFC 1035 section 4 and RFC 6891 section 6.

message decode(std::span<octet const> bfr);

container_t encode(message const& msg);

// Like decode(), but on failure returns false and sets err_msg.
bool validate(std::span<octet const> bfr, std::string& err_msg, message& msg);

} // namespace DNS

#endif // DNS_MESSAGE_DOT_HPP
