#include "DNS-rrs.hpp"

#include "DNS-error.hpp"
#include "DNS-iostream.hpp"
#include "DNS-name.hpp"

#include <string>
#include <vector>

#include <fmt/format.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

using DNS::errc;
using DNS::octet;

namespace {
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

// NAME, TYPE and CLASS, then the rest
DNS::record read_record(std::span<octet const> msg, size_t offset = 0)
{
  DNS::cursor cur{msg};
  cur.seek(offset);
  auto       name = DNS::read_name(cur);
  auto const type = cur.read_type();
  auto const cls  = cur.read_class();
  auto       rec  = DNS::parse_record(cur, std::move(name), type, cls);
  CHECK_EQ(cur.remaining(), 0u) << "record didn't use the whole message";
  return rec;
}

std::vector<octet> written(DNS::record const& rec)
{
  iobuffer<octet> out;
  DNS::write_record(out, rec);
  return {out.begin(), out.end()};
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  // clang-format off
  std::vector<octet> const a_record{
    0,                  // root
    0x00, 0x01,         // A
    0x00, 0x01,         // IN
    0x00, 0x00, 0x0e, 0x10, // 3600
    0x00, 0x04,
    192, 0, 2, 1,
  };
  // clang-format on

  auto const a_rec = read_record(a_record);
  CHECK_EQ(a_rec.name, ".");
  CHECK(a_rec.type() == DNS::RR_type::A);
  CHECK(a_rec.ttl == 3600s);
  CHECK_EQ(std::get<DNS::RR_A>(a_rec.rr).c_str(), std::string("192.0.2.1"));
  CHECK(written(a_rec) == a_record);

  // RDLENGTH says 5, an A record is 4.
  auto a_five = a_record;
  a_five[10]  = 5;
  a_five.push_back(0);
  CHECK_EQ(error_of([&] { read_record(a_five); }), errc::structure);

  // RDLENGTH longer than what's left
  auto a_long = a_record;
  a_long[10]  = 10;
  CHECK_EQ(error_of([&] { read_record(a_long); }), errc::truncated);

  // RDLENGTH says 3
  auto a_short = a_record;
  a_short[10]  = 3;
  CHECK_EQ(error_of([&] { read_record(a_short); }), errc::truncated);

  // An A record in the CHAOS class
  auto a_chaos = a_record;
  a_chaos[4]   = 3;
  CHECK_EQ(error_of([&] { read_record(a_chaos); }), errc::invalid_value);

  auto const chaos_rec = DNS::record{".", DNS::RR_class::CH, 0s,
                                     DNS::RR_A{"192.0.2.1"}};
  CHECK_EQ(error_of([&] { written(chaos_rec); }), errc::misuse);

  // ANY and OPT can't be answers
  auto a_any = a_record;
  a_any[2]   = 0xff;
  CHECK_EQ(error_of([&] { read_record(a_any); }), errc::invalid_value);

  auto a_opt = a_record;
  a_opt[2]   = 41;
  CHECK_EQ(error_of([&] { read_record(a_opt); }), errc::structure);

  // An MX whose exchange points back before its RDATA.
  // clang-format off
  std::vector<octet> const mx_record{
    7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 3, 'c', 'o', 'm', 0, //  0
    0xC0, 0x00,             // 13
    0x00, 0x0f,             // MX
    0x00, 0x01,             // IN
    0x00, 0x00, 0x01, 0x2c, // 300
    0x00, 0x04,
    0x00, 0x0a,             // 10
    0xC0, 0x00,
  };
  // clang-format on

  auto const mx_rec = read_record(mx_record, 13);
  CHECK_EQ(mx_rec.name, "example.com.");
  auto const& mx = std::get<DNS::RR_MX>(mx_rec.rr);
  CHECK_EQ(mx.preference(), 10);
  CHECK_EQ(mx.exchange(), "example.com.");

  // A TXT length octet that runs past RDLENGTH
  // clang-format off
  std::vector<octet> const txt_overrun{
    0,
    0x00, 0x10,             // TXT
    0x00, 0x01,
    0x00, 0x00, 0x00, 0x00,
    0x00, 0x03,
    5, 'a', 'b',
    'c', 'd', 'e',
  };
  // clang-format on
  CHECK_EQ(error_of([&] { read_record(txt_overrun); }), errc::truncated);

  // SOA rname is kept in mailbox form, and written back in zone form.
  CHECK_EQ(*DNS::rname_to_email("username.example.com"),
           "username@example.com");
  CHECK_EQ(*DNS::rname_to_email("Action\\.domains.ISI.EDU"),
           "Action.domains@ISI.EDU");
  CHECK_EQ(DNS::email_to_rname("username@example.com"), "username.example.com");
  CHECK_EQ(DNS::email_to_rname("Action.domains@ISI.EDU"),
           "Action\\.domains.ISI.EDU");
  CHECK(!DNS::rname_to_email("com"));
  CHECK(!DNS::rname_to_email("."));
  CHECK(!DNS::rname_to_email(""));

  // clang-format off
  std::vector<octet> const soa_rdata{
    3, 'n', 's', '1', 7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0,
    10, 'h', 'o', 's', 't', 'm', 'a', 's', 't', 'e', 'r', 7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0,
    0x78, 0x49, 0x00, 0x01, // 2018050049
    0x00, 0x00, 0x1c, 0x20, // 7200
    0x00, 0x00, 0x0e, 0x10, // 3600
    0x00, 0x12, 0x75, 0x00, // 1209600
    0x00, 0x00, 0x01, 0x2c, // 300
  };
  // clang-format on

  std::vector<octet> soa_record{0, 0x00, 0x06, 0x00, 0x01, 0, 0, 0, 0, 0x00,
                                octet(soa_rdata.size())};
  soa_record.insert(soa_record.end(), soa_rdata.begin(), soa_rdata.end());

  auto const soa_rec = read_record(soa_record);
  auto const& soa    = std::get<DNS::RR_SOA>(soa_rec.rr);
  CHECK_EQ(soa.mname(), "ns1.example.");
  CHECK_EQ(soa.rname(), "hostmaster@example.");
  CHECK_EQ(soa.serial(), 2018050049u);
  CHECK(soa.refresh() == 7200s);
  CHECK(soa.retry() == 3600s);
  CHECK(soa.expire() == 1209600s);
  CHECK(soa.minimum() == 300s);
  CHECK(written(soa_rec) == soa_record);

  // Every type, out and back.
  std::vector<DNS::record> const records{
      {"a.example.", DNS::RR_class::IN, 60s, DNS::RR_A{"203.0.113.9"}},
      {"aaaa.example.", DNS::RR_class::IN, 60s, DNS::RR_AAAA{"2001:db8::1"}},
      {"example.", DNS::RR_class::IN, 86400s, DNS::RR_NS{"ns1.example."}},
      {"www.example.", DNS::RR_class::IN, 300s,
       DNS::RR_CNAME{"example.example."}},
      {"9.113.0.203.in-addr.arpa.", DNS::RR_class::IN, 300s,
       DNS::RR_PTR{"a.example."}},
      {"example.", DNS::RR_class::IN, 300s, DNS::RR_MX{"mx.example.", 10}},
      {"example.", DNS::RR_class::IN, 300s,
       DNS::RR_SOA{"ns1.example.", "dns-admin@example.", 1, 900s, 900s, 1800s,
                   60s}},
      {"_ldap._tcp.example.", DNS::RR_class::IN, 300s,
       DNS::RR_SRV{5, 0, 389, "ldap.example."}},
      {"example.", DNS::RR_class::IN, 300s,
       DNS::RR_TXT{std::vector<std::string>{"v=spf1 -all", "", "\x01\xff"}}},
      {"version.bind.", DNS::RR_class::CH, 0s, DNS::RR_TXT{"9.18"}},
      {"黒川.日本.", DNS::RR_class::IN, 300s, DNS::RR_CNAME{"日本."}},
  };

  for (auto const& rec : records) {
    CHECK(read_record(written(rec)) == rec) << rec;
  }

  auto const empty_txt = read_record(written(
      {"example.", DNS::RR_class::IN, 0s, DNS::RR_TXT{std::vector<std::string>{}}}));
  CHECK(std::get<DNS::RR_TXT>(empty_txt.rr).strings().empty());

  CHECK(DNS::rr_type(DNS::RR{DNS::RR_SRV{0, 0, 0, "."}}) == DNS::RR_type::SRV);

  // Things that won't fit.
  auto const big_string = DNS::record{"example.", DNS::RR_class::IN, 0s,
                                      DNS::RR_TXT{std::string(256, 'x')}};
  CHECK_EQ(error_of([&] { written(big_string); }), errc::misuse);

  auto const big_rdata = DNS::record{
      "example.", DNS::RR_class::IN, 0s,
      DNS::RR_TXT{std::vector<std::string>(300, std::string(255, 'x'))}};
  CHECK_EQ(error_of([&] { written(big_rdata); }), errc::misuse);

  auto const big_ttl = DNS::record{"example.", DNS::RR_class::IN,
                                   std::chrono::seconds{1LL << 32},
                                   DNS::RR_NS{"ns.example."}};
  CHECK_EQ(error_of([&] { written(big_ttl); }), errc::misuse);

  auto const bad_ns = DNS::record{"example.", DNS::RR_class::IN, 0s,
                                  DNS::RR_NS{"ns..example."}};
  CHECK_EQ(error_of([&] { written(bad_ns); }), errc::bad_name);
}
