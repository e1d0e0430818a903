#include "DNS-message.hpp"

#include "DNS-cursor.hpp"
#include "DNS-error.hpp"
#include "DNS-iostream.hpp"
#include "DNS-name.hpp"
#include "IDNA.hpp"

#include <algorithm>
#include <experimental/random>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(log_dns_data, false, "log all DNS wire data as hex");

/*
                                           1  1  1  1  1  1
             0  1  2  3  4  5  6  7  8  9  0  1  2  3  4  5
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                      ID                       |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |QR|   Opcode  |AA|TC|RD|RA| Z|AD|CD|   RCODE   |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    QDCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    ANCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    NSCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
            |                    ARCOUNT                    |
            +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+

 */

namespace {
using DNS::octet;

auto constexpr header_sz = 12;

// Smallest possible entries, a root name and the fixed fields.
auto constexpr min_question_sz = 1 + 4;
auto constexpr min_record_sz   = 1 + 10;

// flags_0
octet constexpr QR_bit     = 0x80;
octet constexpr opcode_msk = 0x78;
int constexpr   opcode_shf = 3;
octet constexpr AA_bit     = 0x04;
octet constexpr TC_bit     = 0x02;
octet constexpr RD_bit     = 0x01;

// flags_1
octet constexpr RA_bit    = 0x80;
octet constexpr Z_bit     = 0x40;
octet constexpr AD_bit    = 0x20;
octet constexpr CD_bit    = 0x10;
octet constexpr rcode_msk = 0x0F;

/*

<https://tools.ietf.org/html/rfc6891#section-6.1.2>

       +------------+--------------+------------------------------+
       | Field Name | Field Type   | Description                  |
       +------------+--------------+------------------------------+
       | NAME       | domain name  | MUST be 0 (root domain)      |
       | TYPE       | u_int16_t    | OPT (41)                     |
       | CLASS      | u_int16_t    | requestor's UDP payload size |
       | TTL        | u_int32_t    | extended RCODE and flags     |
       | RDLEN      | u_int16_t    | length of all RDATA          |
       | RDATA      | octet stream | {attribute,value} pairs      |
       +------------+--------------+------------------------------+

<https://tools.ietf.org/html/rfc3225>

3. Protocol Changes, in place of TTL

                +0 (MSB)                +1 (LSB)
         +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
      0: |   EXTENDED-RCODE      |       VERSION         |
         +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+
      2: |DO|                    Z                       |
         +--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+--+

*/

octet constexpr DO_bit = 0x80;

// Everything after the NAME and TYPE.
DNS::extension read_extension(DNS::cursor& cur)
{
  DNS::extension ext;
  ext.payload_size   = cur.read_u16();
  ext.extended_rcode = cur.read_u8();
  ext.version        = cur.read_u8();
  ext.dnssec_ok      = (cur.read_u8() & DO_bit) != 0;
  cur.read_u8(); // rest of Z

  // No options are understood, but they must be present.
  auto const rdlen = cur.read_u16();
  if (rdlen) {
    VLOG(1) << "skipping " << rdlen << " octets of EDNS options";
  }
  cur.skip(rdlen);

  return ext;
}

void write_extension(DNS::container_t& out, DNS::extension const& ext)
{
  out.put_u8(0); // root
  out.put_u16(static_cast<uint16_t>(DNS::RR_type::OPT));
  out.put_u16(ext.payload_size);
  out.put_u8(ext.extended_rcode);
  out.put_u8(ext.version);
  out.put_u8(ext.dnssec_ok ? DO_bit : 0);
  out.put_u8(0);
  out.put_u16(0); // RDLEN
}

enum class section : uint8_t { answer, authority, additional };

constexpr char const* section_c_str(section s)
{
  switch (s) { // clang-format off
  case section::answer:     return "answer";
  case section::authority:  return "authority";
  case section::additional: return "additional";
  } // clang-format on
  return "*** unknown section ***";
}

void read_records(DNS::cursor&              cur,
                  uint16_t                  count,
                  section                   sect,
                  std::vector<DNS::record>& records,
                  DNS::message&             msg)
{
  records.reserve(std::min<size_t>(count, cur.remaining() / min_record_sz));
  for (auto n = 0u; n < count; ++n) {
    auto name       = DNS::read_name(cur);
    auto const type = cur.read_type();

    // The OPT "class" is the payload size, so catch it before read_class().
    if (type == DNS::RR_type::OPT) {
      if (sect != section::additional) {
        throw DNS::parse_error(DNS::errc::structure,
                               fmt::format("OPT pseudo-record in {} section",
                                           section_c_str(sect)));
      }
      if (name != ".") {
        throw DNS::parse_error(DNS::errc::structure,
                               fmt::format("OPT pseudo-record owner «{}» is "
                                           "not the root",
                                           name));
      }
      if (msg.ext) {
        throw DNS::parse_error(DNS::errc::structure,
                               "more than one OPT pseudo-record");
      }
      msg.ext = read_extension(cur);
      continue;
    }

    auto const cls = cur.read_class();
    records.push_back(DNS::parse_record(cur, std::move(name), type, cls));
  }
}

uint16_t count_of(size_t n, char const* what)
{
  if (n > std::numeric_limits<uint16_t>::max()) {
    throw DNS::encode_error(DNS::errc::misuse,
                            fmt::format("{} {} won't fit in a 16 bit count", n,
                                        what));
  }
  return static_cast<uint16_t>(n);
}

void log_data(char const* what, std::span<octet const> bfr)
{
  LOG(INFO) << what << " " << bfr.size() << " octets: "
            << fmt::format("{:02x}", fmt::join(bfr, " "));
}
} // namespace

namespace DNS {

uint16_t random_id()
{
  return std::experimental::randint(std::numeric_limits<uint16_t>::min(),
                                    std::numeric_limits<uint16_t>::max());
}

message::message(id_source const& ids)
  : id(ids())
  , rd(true)
  , ad(true)
{
}

void message::add_question(std::string_view domain, RR_type type, RR_class cls)
{
  std::string name;
  try {
    name = IDNA::to_unicode(IDNA::to_ascii(domain));
  }
  catch (std::invalid_argument const& ex) {
    throw encode_error(errc::bad_name,
                       fmt::format("question «{}»: {}", domain, ex.what()));
  }
  name += '.';
  questions.push_back(question{std::move(name), type, cls});
}

uint16_t message::full_rcode() const
{
  auto const low = static_cast<uint16_t>(rc);
  if (!ext)
    return low;
  return (uint16_t(ext->extended_rcode) << 4) | low;
}

message decode(std::span<octet const> bfr)
{
  if (FLAGS_log_dns_data)
    log_data("decode", bfr);

  if (bfr.size() < header_sz) {
    throw parse_error(errc::truncated,
                      fmt::format("message of {} octets is shorter than the "
                                  "{} octet header",
                                  bfr.size(), header_sz));
  }

  cursor cur{bfr};
  message msg;

  msg.id = cur.read_u16();

  auto const flags_0 = cur.read_u8();
  auto const flags_1 = cur.read_u8();

  msg.qr = (flags_0 & QR_bit) != 0;
  msg.aa = (flags_0 & AA_bit) != 0;
  msg.tc = (flags_0 & TC_bit) != 0;
  msg.rd = (flags_0 & RD_bit) != 0;

  msg.ra = (flags_1 & RA_bit) != 0;
  msg.z  = (flags_1 & Z_bit) != 0;
  msg.ad = (flags_1 & AD_bit) != 0;
  msg.cd = (flags_1 & CD_bit) != 0;

  auto const op_val = (flags_0 & opcode_msk) >> opcode_shf;
  auto const op     = opcode_from_u8(op_val);
  if (!op) {
    throw parse_error(errc::invalid_value,
                      fmt::format("invalid Opcode({})", op_val));
  }
  msg.op = *op;

  auto const rc_val = flags_1 & rcode_msk;
  auto const rc     = rcode_from_u8(rc_val);
  if (!rc) {
    throw parse_error(errc::invalid_value,
                      fmt::format("invalid RCODE({})", rc_val));
  }
  msg.rc = *rc;

  auto const qdcount = cur.read_u16();
  auto const ancount = cur.read_u16();
  auto const nscount = cur.read_u16();
  auto const arcount = cur.read_u16();

  msg.questions.reserve(
      std::min<size_t>(qdcount, cur.remaining() / min_question_sz));
  for (auto n = 0u; n < qdcount; ++n) {
    auto name       = read_name(cur);
    auto const type = cur.read_type();
    auto const cls  = cur.read_class();
    msg.questions.push_back(question{std::move(name), type, cls});
  }

  read_records(cur, ancount, section::answer, msg.answers, msg);
  read_records(cur, nscount, section::authority, msg.authority, msg);
  read_records(cur, arcount, section::additional, msg.additional, msg);

  if (cur.remaining()) {
    throw parse_error(errc::structure,
                      fmt::format("finished parsing with {} bytes left over",
                                  cur.remaining()));
  }

  if (msg.qr && msg.full_rcode()) {
    VLOG(1) << "response " << msg.id << " RCODE " << msg.full_rcode() << ": "
            << rcode_desc_c_str(msg.full_rcode());
  }

  return msg;
}

bool validate(std::span<octet const> bfr, std::string& err_msg, message& msg)
{
  try {
    msg = decode(bfr);
  }
  catch (error const& ex) {
    err_msg = fmt::format("{}: {}", errc_c_str(ex.code()), ex.what());
    LOG(WARNING) << err_msg;
    return false;
  }
  return true;
}

container_t encode(message const& msg)
{
  auto const qdcount = count_of(msg.questions.size(), "questions");
  auto const ancount = count_of(msg.answers.size(), "answers");
  auto const nscount = count_of(msg.authority.size(), "authority records");
  auto const arcount = count_of(msg.additional.size() + (msg.ext ? 1 : 0),
                                "additional records");

  if (static_cast<uint8_t>(msg.op) > (opcode_msk >> opcode_shf)) {
    throw encode_error(errc::misuse, fmt::format("bad opcode {}", msg.op));
  }

  octet flags_0 = static_cast<uint8_t>(msg.op) << opcode_shf;
  if (msg.qr)
    flags_0 |= QR_bit;
  if (msg.aa)
    flags_0 |= AA_bit;
  if (msg.tc)
    flags_0 |= TC_bit;
  if (msg.rd)
    flags_0 |= RD_bit;

  octet flags_1 = static_cast<uint8_t>(msg.rc) & rcode_msk;
  if (msg.ra)
    flags_1 |= RA_bit;
  if (msg.z)
    flags_1 |= Z_bit;
  if (msg.ad)
    flags_1 |= AD_bit;
  if (msg.cd)
    flags_1 |= CD_bit;

  container_t out;
  out.reserve(Config::max_udp_sz);

  out.put_u16(msg.id);
  out.put_u8(flags_0);
  out.put_u8(flags_1);
  out.put_u16(qdcount);
  out.put_u16(ancount);
  out.put_u16(nscount);
  out.put_u16(arcount);

  for (auto const& q : msg.questions) {
    write_name(out, q.name);
    out.put_u16(static_cast<uint16_t>(q.type));
    out.put_u16(static_cast<uint16_t>(q.cls));
  }

  for (auto const& rec : msg.answers)
    write_record(out, rec);
  for (auto const& rec : msg.authority)
    write_record(out, rec);
  for (auto const& rec : msg.additional)
    write_record(out, rec);

  if (msg.ext)
    write_extension(out, *msg.ext);

  if (FLAGS_log_dns_data)
    log_data("encode", out);

  return out;
}

} // namespace DNS
