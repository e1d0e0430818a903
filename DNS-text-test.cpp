#include "DNS-text.hpp"

#include "DNS-iostream.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

using DNS::RR_from_string;
using DNS::RR_type;

namespace {
std::string text(DNS::RR const& rr)
{
  std::ostringstream os;
  os << rr;
  return os.str();
}

bool rejects(RR_type type, std::string_view rdata)
{
  try {
    RR_from_string(type, rdata);
  }
  catch (std::invalid_argument const& ex) {
    LOG(INFO) << ex.what();
    return true;
  }
  return false;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  DNS::RR const spf{DNS::RR_TXT{"v=spf1 include:_spf.google.com ~all"}};
  CHECK_EQ(text(spf), R"("v=spf1 include:_spf.google.com ~all")");
  CHECK_EQ(fmt::format("{}", spf), R"("v=spf1 include:_spf.google.com ~all")");

  DNS::RR const odd_txt{DNS::RR_TXT{
      std::vector<std::string>{R"(say "hi")", "back\\slash", "\x01"}}};
  CHECK_EQ(text(odd_txt), R"("say \"hi\"" "back\\slash" "\001")");
  CHECK(RR_from_string(RR_type::TXT, text(odd_txt)) == odd_txt);

  // a bare word is a character-string too
  CHECK(RR_from_string(RR_type::TXT, "9.18") ==
        DNS::RR{DNS::RR_TXT{"9.18"}});
  CHECK(RR_from_string(RR_type::TXT, R"("")") == DNS::RR{DNS::RR_TXT{""}});

  // Text form of every type, and back again.
  struct text_case {
    RR_type     type;
    char const* rdata;
  };
  text_case const cases[]{
      {RR_type::A, "192.0.2.1"},
      {RR_type::AAAA, "2001:db8::1"},
      {RR_type::NS, "ns1.google.com."},
      {RR_type::CNAME, "www.example.com."},
      {RR_type::PTR, "dns.google."},
      {RR_type::MX, "10 smtp.google.com."},
      {RR_type::SOA,
       "ns1.google.com. dns-admin@google.com. 376337657 900 900 1800 60"},
      {RR_type::SRV, "5 0 389 ldap.google.com."},
      {RR_type::TXT, R"("v=spf1 -all" "second string")"},
  };
  for (auto const& c : cases) {
    auto const rr = RR_from_string(c.type, c.rdata);
    CHECK(DNS::rr_type(rr) == c.type) << c.rdata;
    CHECK_EQ(text(rr), c.rdata);
  }

  // Names are absolute with or without the final dot.
  CHECK(RR_from_string(RR_type::NS, "ns1.google.com") ==
        DNS::RR{DNS::RR_NS{"ns1.google.com."}});
  CHECK(RR_from_string(RR_type::CNAME, R"(a\.b)") ==
        DNS::RR{DNS::RR_CNAME{R"(a\.b.)"}});
  CHECK(RR_from_string(RR_type::MX, "  0   . ") ==
        DNS::RR{DNS::RR_MX{".", 0}});

  // SOA rname in zone file form becomes a mailbox.
  auto const soa = RR_from_string(
      RR_type::SOA,
      R"(ns.isi.edu. Action\.domains.ISI.EDU. 2024010101 7200 3600 1209600 300)");
  auto const& soa_rr = std::get<DNS::RR_SOA>(soa);
  CHECK_EQ(soa_rr.mname(), "ns.isi.edu.");
  CHECK_EQ(soa_rr.rname(), "Action.domains@ISI.EDU.");
  CHECK_EQ(soa_rr.serial(), 2024010101u);
  CHECK(soa_rr.refresh() == 7200s);
  CHECK(soa_rr.minimum() == 300s);

  // Bad text
  CHECK(rejects(RR_type::A, "192.0.2"));
  CHECK(rejects(RR_type::A, "2001:db8::1"));
  CHECK(rejects(RR_type::AAAA, "192.0.2.1"));
  CHECK(rejects(RR_type::A, ""));
  CHECK(rejects(RR_type::NS, "one two"));
  CHECK(rejects(RR_type::MX, "smtp.google.com."));
  CHECK(rejects(RR_type::MX, "65536 smtp.google.com."));
  CHECK(rejects(RR_type::MX, "-1 smtp.google.com."));
  CHECK(rejects(RR_type::SRV, "1 2 smtp.google.com."));
  CHECK(rejects(RR_type::SOA, "a. b. 1 2 3 4"));
  CHECK(rejects(RR_type::SOA, "a. b. 4294967296 2 3 4 5"));
  CHECK(rejects(RR_type::TXT, R"("unterminated)"));
  CHECK(rejects(RR_type::TXT, R"("bad \escape\2")"));
  CHECK(rejects(RR_type::TXT, fmt::format(R"("{}")", std::string(256, 'x'))));

  // No RDATA of their own.
  CHECK(rejects(RR_type::OPT, ""));
  CHECK(rejects(RR_type::ANY, ""));
  CHECK(rejects(RR_type::Reserved, ""));

  // Mnemonics
  CHECK(DNS::RR_type_from_string("MX") == RR_type::MX);
  CHECK(DNS::RR_type_from_string("aaaa") == RR_type::AAAA);
  CHECK(!DNS::RR_type_from_string("TLSA"));
  CHECK(DNS::RR_class_from_string("in") == DNS::RR_class::IN);
  CHECK(DNS::RR_class_from_string("*") == DNS::RR_class::ANY);
  CHECK(DNS::RR_class_from_string("ANY") == DNS::RR_class::ANY);
  CHECK(!DNS::RR_class_from_string("XX"));

  CHECK_EQ(fmt::format("{} {} {} {}", RR_type::SRV, DNS::RR_class::CH,
                       DNS::opcode::NOTIFY, DNS::rcode::NXDOMAIN),
           "SRV CH NOTIFY NXDOMAIN");
  CHECK_EQ(std::string(DNS::rcode_desc_c_str(3)), "non-existent domain");

  // Whole records and questions
  DNS::record const mx{"google.com.", DNS::RR_class::IN, 300s,
                       DNS::RR_MX{"smtp.google.com.", 10}};
  CHECK_EQ(fmt::format("{}", mx), "google.com. 300 IN MX 10 smtp.google.com.");

  DNS::question const q{"google.com.", RR_type::MX, DNS::RR_class::IN};
  CHECK_EQ(fmt::format("{}", q), "google.com. IN MX");
}
