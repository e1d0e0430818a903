#include "DNS-name.hpp"

#include "DNS-error.hpp"
#include "DNS-iostream.hpp"

#include <string>
#include <tuple>
#include <vector>

#include <gflags/gflags.h>

#include <glog/logging.h>

DECLARE_bool(lenient_idna);

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

std::vector<octet> wire(std::string_view name)
{
  iobuffer<octet> out;
  DNS::write_name(out, name);
  return {out.begin(), out.end()};
}

errc read_error(std::vector<octet> const& msg, size_t offset = 0)
{
  return error_of([&] { DNS::read_name(msg, offset); });
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  // clang-format off
  std::vector<octet> const www_google_com{
    3, 'w', 'w', 'w',
    6, 'g', 'o', 'o', 'g', 'l', 'e',
    3, 'c', 'o', 'm',
    0,
  };
  // clang-format on

  auto [name, len] = DNS::read_name(www_google_com, 0);
  CHECK_EQ(name, "www.google.com.");
  CHECK_EQ(len, www_google_com.size());

  CHECK(wire("www.google.com") == www_google_com);
  CHECK(wire("www.google.com.") == www_google_com);

  std::vector<octet> const root{0};
  std::tie(name, len) = DNS::read_name(root, 0);
  CHECK_EQ(name, ".");
  CHECK_EQ(len, 1u);
  CHECK(wire(".") == root);
  CHECK(wire("") == root);

  // clang-format off
  std::vector<octet> const compressed{
    7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 3, 'c', 'o', 'm', 0, //  0
    3, 'w', 'w', 'w', 0xC0, 0x00,                               // 13
    0xC0, 0x0D,                                                 // 19
    1, 'c', 0xC0, 0x0D,                                         // 21
  };
  // clang-format on

  std::tie(name, len) = DNS::read_name(compressed, 13);
  CHECK_EQ(name, "www.example.com.");
  CHECK_EQ(len, 6u); // not counting the octets at the target

  std::tie(name, len) = DNS::read_name(compressed, 19);
  CHECK_EQ(name, "www.example.com.");
  CHECK_EQ(len, 2u);

  // two hops
  std::tie(name, len) = DNS::read_name(compressed, 21);
  CHECK_EQ(name, "c.www.example.com.");
  CHECK_EQ(len, 4u);

  // a cursor is left just past the name
  DNS::cursor cur{compressed};
  cur.seek(13);
  CHECK_EQ(DNS::read_name(cur), "www.example.com.");
  CHECK_EQ(cur.pos(), 19u);

  // pointers to themselves, ahead, or back into the same name
  CHECK_EQ(read_error({0xC0, 0x00}), errc::bad_pointer);
  CHECK_EQ(read_error({0xC0, 0x02, 0x00}), errc::bad_pointer);
  CHECK_EQ(read_error({3, 'a', 'b', 'c', 0xC0, 0x00}), errc::bad_pointer);
  CHECK_EQ(read_error({0, 1, 'x', 0xC0, 0x01}, 1), errc::bad_pointer);

  // back, then forward again from there
  CHECK_EQ(read_error({1, 'a', 0xC0, 0x06, 1, 'b', 0xC0, 0x00}, 4),
           errc::bad_pointer);

  // reserved label types
  CHECK_EQ(read_error({0x40, 0x00}), errc::bad_pointer);
  CHECK_EQ(read_error({0x80, 0x00}), errc::bad_pointer);

  // off the end
  CHECK_EQ(read_error({5, 'a', 'b'}), errc::truncated);
  CHECK_EQ(read_error({1, 'a'}), errc::truncated);
  CHECK_EQ(read_error({0xC0}), errc::truncated);
  CHECK_EQ(read_error({}), errc::truncated);

  // not ASCII, and not an A-label
  CHECK_EQ(read_error({2, 0xC3, 0xA9, 0}), errc::bad_name);

  // more than 255 octets
  std::vector<octet> long_name;
  for (auto n = 0; n < 5; ++n) {
    long_name.push_back(63);
    long_name.insert(long_name.end(), 63, 'x');
  }
  long_name.push_back(0);
  CHECK_EQ(read_error(long_name), errc::bad_name);

  // Dots and backslashes inside a label.
  // clang-format off
  std::vector<octet> const odd_labels{
    3, 'a', '.', 'b',
    3, 'c', '\\', 'd',
    3, 'c', 'o', 'm',
    0,
  };
  // clang-format on
  std::tie(name, len) = DNS::read_name(odd_labels, 0);
  CHECK_EQ(name, R"(a\.b.c\\d.com.)");
  CHECK(wire(name) == odd_labels);

  // International names go out as A-labels, and come back as U-labels.
  auto const idn = wire("黒川.日本");
  CHECK(idn == wire("xn--5rtw95l.xn--wgv71a."));
  std::tie(name, len) = DNS::read_name(idn, 0);
  CHECK_EQ(name, "黒川.日本.");
  CHECK_EQ(len, idn.size());

  // A-labels that don't decode, or decode to something that isn't a
  // U-label, are kept as is only with --lenient_idna.
  std::vector<octet> const bad_punycode{8, 'x', 'n', '-', '-', 'a', 'b', '_', 'c', 0};
  std::vector<octet> const not_a_u_label{5, 'x', 'n', '-', '-', 'a', 0};
  CHECK_EQ(read_error(bad_punycode), errc::bad_name);
  CHECK_EQ(read_error(not_a_u_label), errc::bad_name);

  FLAGS_lenient_idna = true;
  std::tie(name, len) = DNS::read_name(bad_punycode, 0);
  CHECK_EQ(name, "xn--ab_c.");
  std::tie(name, len) = DNS::read_name(not_a_u_label, 0);
  CHECK_EQ(name, "xn--a.");
  FLAGS_lenient_idna = false;

  // Bad names can't be written.
  auto write_error = [](std::string_view nm) {
    return error_of([nm] { wire(nm); });
  };
  CHECK_EQ(write_error("a..b"), errc::bad_name);
  CHECK_EQ(write_error(".com"), errc::bad_name);
  CHECK_EQ(write_error(std::string(64, 'x')), errc::bad_name);

  std::string const x63(63, 'x');
  auto const name_255 = x63 + '.' + x63 + '.' + x63 + '.' + std::string(61, 'x');
  CHECK_EQ(wire(name_255).size(), 255u);
  CHECK_EQ(write_error(name_255 + 'x'), errc::bad_name);
  CHECK_EQ(write_error(name_255 + ".x"), errc::bad_name);

  try {
    wire("a..b");
    LOG(FATAL) << "should have thrown";
  }
  catch (DNS::encode_error const& ex) {
    CHECK_EQ(std::string(ex.what()), "empty label in domain name 'a..b'");
  }
}
