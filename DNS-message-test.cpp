#include "DNS-message.hpp"

#include "DNS-error.hpp"
#include "DNS-iostream.hpp"

#include <string>
#include <vector>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::chrono_literals;
using namespace std::string_literals;

using DNS::errc;
using DNS::octet;

namespace {
uint16_t fixed_id() { return 0x1234; }

template <typename Fn>
errc error_of(Fn fn)
{
  try {
    fn();
  }
  catch (DNS::error const& ex) {
    LOG(INFO) << ex.what();
    return ex.code();
  }
  LOG(FATAL) << "expected an error";
  return errc::misuse;
}

errc decode_error(std::vector<octet> const& bfr)
{
  return error_of([&] { DNS::decode(bfr); });
}

std::vector<octet> encoded(DNS::message const& msg)
{
  auto const bfr = DNS::encode(msg);
  return {bfr.begin(), bfr.end()};
}

// clang-format off
std::vector<octet> const query_header{
  0x12, 0x34,
  0x01, 0x00, // RD
  0x00, 0x01, // QDCOUNT
  0x00, 0x00,
  0x00, 0x00,
  0x00, 0x00,
};

std::vector<octet> const www_google_com{
  3, 'w', 'w', 'w', 6, 'g', 'o', 'o', 'g', 'l', 'e', 3, 'c', 'o', 'm', 0,
};
// clang-format on

std::vector<octet> operator+(std::vector<octet> a, std::vector<octet> const& b)
{
  a.insert(a.end(), b.begin(), b.end());
  return a;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  DNS::message query{fixed_id};
  CHECK_EQ(query.id, 0x1234);
  CHECK(query.rd);
  CHECK(query.ad);
  CHECK(!query.qr);
  CHECK(query.op == DNS::opcode::QUERY);
  CHECK(query.questions.empty());
  CHECK(!query.ext);

  query.add_question("www.google.com", DNS::RR_type::A, DNS::RR_class::IN);
  query.add_extension(DNS::extension{});
  CHECK_EQ(query.questions[0].name, "www.google.com.");
  CHECK_EQ(query.ext->payload_size, 4096);

  // clang-format off
  std::vector<octet> const query_bytes{
    0x12, 0x34,
    0x01, 0x20, // RD AD
    0x00, 0x01, // QDCOUNT
    0x00, 0x00, // ANCOUNT
    0x00, 0x00, // NSCOUNT
    0x00, 0x01, // ARCOUNT

    0x03, 0x77, 0x77, 0x77,
    0x06, 0x67, 0x6F, 0x6F, 0x67, 0x6C, 0x65,
    0x03, 0x63, 0x6F, 0x6D,
    0x00,
    0x00, 0x01, // A
    0x00, 0x01, // IN

    0x00,       // root
    0x00, 0x29, // OPT
    0x10, 0x00, // 4096
    0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, // RDLEN
  };
  // clang-format on

  auto const bytes = encoded(query);
  CHECK(bytes == query_bytes);
  CHECK(DNS::decode(bytes) == query);

  // questions and extension only
  DNS::message q2{fixed_id};
  q2.add_question("黒川.日本", DNS::RR_type::MX, DNS::RR_class::IN);
  q2.add_question("EXAMPLE.com.", DNS::RR_type::ANY, DNS::RR_class::ANY);
  q2.add_question("", DNS::RR_type::NS, DNS::RR_class::IN);
  q2.add_extension({1232, 0, 0, true});
  CHECK_EQ(q2.questions[0].name, "黒川.日本.");
  CHECK_EQ(q2.questions[1].name, "example.com.");
  CHECK_EQ(q2.questions[2].name, ".");
  CHECK(DNS::decode(encoded(q2)) == q2);

  DNS::message no_ext{fixed_id};
  no_ext.add_question("example.com", DNS::RR_type::TXT, DNS::RR_class::IN);
  auto const no_ext_bytes = encoded(no_ext);
  CHECK_EQ(no_ext_bytes[11], 0); // ARCOUNT
  CHECK(DNS::decode(no_ext_bytes) == no_ext);

  // A response with every section, every flag, and an extended RCODE.
  DNS::message rsp;
  rsp.id = 0xbeef;
  rsp.qr = rsp.aa = rsp.tc = rsp.rd = rsp.ra = rsp.ad = rsp.cd = true;
  rsp.op = DNS::opcode::NOTIFY;
  rsp.rc = DNS::rcode::NXDOMAIN;
  rsp.add_question("example.com", DNS::RR_type::SOA, DNS::RR_class::IN);
  rsp.answers.push_back({"example.com.", DNS::RR_class::IN, 3600s,
                         DNS::RR_SOA{"ns.example.com.", "root@example.com.",
                                     7, 1h, 10min, 7 * 24h, 5min}});
  rsp.answers.push_back(
      {"example.com.", DNS::RR_class::IN, 60s, DNS::RR_A{"198.51.100.7"}});
  rsp.authority.push_back({"example.com.", DNS::RR_class::IN, 3600s,
                           DNS::RR_NS{"ns.example.com."}});
  rsp.additional.push_back({"ns.example.com.", DNS::RR_class::IN, 3600s,
                            DNS::RR_AAAA{"2001:db8::53"}});
  rsp.add_extension({4096, 1, 0, true});
  CHECK_EQ(rsp.full_rcode(), (1 << 4) | 3);

  auto const rsp_bytes = encoded(rsp);
  CHECK_EQ(rsp_bytes[2], 0x80 | (4 << 3) | 0x04 | 0x02 | 0x01);
  CHECK_EQ(rsp_bytes[3], 0x80 | 0x20 | 0x10 | 3);
  CHECK_EQ(rsp_bytes[11], 2); // ARCOUNT includes the OPT
  auto const rsp2 = DNS::decode(rsp_bytes);
  CHECK(rsp2 == rsp);
  CHECK_EQ(rsp2.full_rcode(), 19);

  DNS::message plain;
  plain.rc = DNS::rcode::REFUSED;
  CHECK_EQ(plain.full_rcode(), 5);

  // A compressed response, as a server would send it.
  // clang-format off
  auto const compressed = std::vector<octet>{
    0x12, 0x34,
    0x81, 0x80,
    0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
  } + www_google_com + std::vector<octet>{
    0x00, 0x01, 0x00, 0x01,
    0xC0, 0x0C, // www.google.com
    0x00, 0x01, 0x00, 0x01,
    0x00, 0x00, 0x00, 0x2a,
    0x00, 0x04,
    142, 250, 72, 196,
  };
  // clang-format on

  auto const answer = DNS::decode(compressed);
  CHECK(answer.qr);
  CHECK(answer.ra);
  CHECK_EQ(answer.answers.size(), 1u);
  CHECK_EQ(answer.answers[0].name, "www.google.com.");
  CHECK(answer.answers[0].ttl == 42s);
  CHECK_EQ(std::get<DNS::RR_A>(answer.answers[0].rr).c_str(),
           "142.250.72.196"s);

  // Broken messages

  // short header
  CHECK_EQ(decode_error({0x12, 0x34, 0x01, 0x00, 0x00}), errc::truncated);
  CHECK_EQ(decode_error({}), errc::truncated);

  // a question that isn't there
  CHECK_EQ(decode_error(query_header), errc::truncated);

  // every count at 65535 with nothing behind them
  CHECK_EQ(decode_error({0x12, 0x34, 0x01, 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                         0xFF, 0xFF, 0xFF}),
           errc::truncated);
  auto huge_counts =
      query_header + www_google_com + std::vector<octet>{0, 1, 0, 1};
  for (auto i = 6; i < 12; ++i)
    huge_counts[i] = 0xFF;
  CHECK_EQ(decode_error(huge_counts), errc::truncated);

  // question name pointing at itself
  CHECK_EQ(decode_error(query_header + std::vector<octet>{0xC0, 0x0C, 0, 1, 0, 1}),
           errc::bad_pointer);

  // trailing garbage
  auto const extra = query_bytes + std::vector<octet>{0};
  CHECK_EQ(decode_error(extra), errc::structure);
  try {
    DNS::decode(extra);
    LOG(FATAL) << "should have thrown";
  }
  catch (DNS::parse_error const& ex) {
    CHECK_EQ(ex.what(), "finished parsing with 1 bytes left over"s);
  }

  // clang-format off
  std::vector<octet> const opt{
    0x00, 0x00, 0x29, 0x10, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
  };
  std::vector<octet> const a_answer{
    0xC0, 0x0C,
    0x00, 0x01, 0x00, 0x01,
    0x00, 0x00, 0x00, 0x2a,
    0x00, 0x04,
    192, 0, 2, 1,
  };
  // clang-format on

  auto with_counts = [](uint16_t an, uint16_t ns, uint16_t ar) {
    auto hdr = query_header;
    hdr[7]   = an;
    hdr[9]   = ns;
    hdr[11]  = ar;
    return hdr;
  };
  auto const question = www_google_com + std::vector<octet>{0, 1, 0, 1};

  // two OPT records
  CHECK_EQ(decode_error(with_counts(0, 0, 2) + question + opt + opt),
           errc::structure);

  // OPT outside the additional section
  CHECK_EQ(decode_error(with_counts(1, 0, 0) + question + opt),
           errc::structure);
  CHECK_EQ(decode_error(with_counts(0, 1, 0) + question + opt),
           errc::structure);

  // OPT with a name
  auto named_opt = std::vector<octet>{0xC0, 0x0C} + opt;
  named_opt.erase(named_opt.begin() + 2);
  CHECK_EQ(decode_error(with_counts(0, 0, 1) + question + named_opt),
           errc::structure);

  // OPT with RDATA we don't understand, and skip
  // clang-format off
  std::vector<octet> const opt_cookie{
    0x00, 0x00, 0x29, 0x04, 0xd0, 0x00, 0x00, 0x80, 0x00, 0x00, 0x0c,
    0x00, 0x0a, 0x00, 0x08, 1, 2, 3, 4, 5, 6, 7, 8,
  };
  // clang-format on
  auto const cookie = DNS::decode(with_counts(0, 0, 1) + question + opt_cookie);
  CHECK(cookie.ext);
  CHECK_EQ(cookie.ext->payload_size, 1232);
  CHECK(cookie.ext->dnssec_ok);
  CHECK(cookie.additional.empty());

  // OPT RDLEN past the end
  auto short_opt = opt;
  short_opt.back() = 4;
  CHECK_EQ(decode_error(with_counts(0, 0, 1) + question + short_opt),
           errc::truncated);

  // type 3
  auto type_3 = a_answer;
  type_3[3]   = 3;
  CHECK_EQ(decode_error(with_counts(1, 0, 0) + question + type_3),
           errc::invalid_value);

  // A record with RDLENGTH 5
  auto a_five = a_answer;
  a_five[11]  = 5;
  a_five.push_back(0);
  CHECK_EQ(decode_error(with_counts(1, 0, 0) + question + a_five),
           errc::structure);

  // RDLENGTH past the end of the message
  auto a_long = a_answer;
  a_long[11]  = 200;
  CHECK_EQ(decode_error(with_counts(1, 0, 0) + question + a_long),
           errc::truncated);

  // ANCOUNT larger than the answers present
  CHECK_EQ(decode_error(with_counts(2, 0, 0) + question + a_answer),
           errc::truncated);

  // unassigned opcode and rcode
  auto bad_op = query_bytes;
  bad_op[2]   = 3 << 3;
  CHECK_EQ(decode_error(bad_op), errc::invalid_value);

  auto bad_rc = query_bytes;
  bad_rc[3]   = 12;
  CHECK_EQ(decode_error(bad_rc), errc::invalid_value);

  // The non-throwing version.
  DNS::message out;
  std::string  err;
  CHECK(DNS::validate(query_bytes, err, out));
  CHECK(out == query);
  CHECK(!DNS::validate(extra, err, out));
  CHECK_EQ(err, "structure mismatch: finished parsing with 1 bytes left over");

  // Things that can't be encoded.
  DNS::message bad_name{fixed_id};
  CHECK_EQ(error_of([&] {
             bad_name.add_question("a..b", DNS::RR_type::A, DNS::RR_class::IN);
             encoded(bad_name);
           }),
           errc::bad_name);

  DNS::message chaos_a{fixed_id};
  chaos_a.answers.push_back(
      {"a.", DNS::RR_class::CH, 0s, DNS::RR_A{"192.0.2.1"}});
  CHECK_EQ(error_of([&] { encoded(chaos_a); }), errc::misuse);

  DNS::message too_many{fixed_id};
  too_many.questions.resize(65536, DNS::question{".", DNS::RR_type::A,
                                                 DNS::RR_class::IN});
  CHECK_EQ(error_of([&] { encoded(too_many); }), errc::misuse);

  // The default ID source gives a recursive query.
  DNS::message random{DNS::random_id};
  CHECK(random.rd);
}
