#ifndef DNS_TEXT_DOT_HPP
#define DNS_TEXT_DOT_HPP

#include <string_view>

#include "DNS-rrs.hpp"
#include "DNS-types.hpp"

namespace DNS {

// Parse RDATA in the text form operator<< writes, so:
//
//   RR_from_string(RR_type::MX, "10 mx.example.com.")
//   RR_from_string(RR_type::TXT, R"("v=spf1 -all" "second")")
//
// Names without a trailing dot are taken as absolute. An SOA rname may
// be in zone file or in mailbox form. Throws std::invalid_argument for
// bad text and for types that have no RDATA of their own.
RR RR_from_string(RR_type type, std::string_view rdata);

} // namespace DNS

#endif // DNS_TEXT_DOT_HPP
