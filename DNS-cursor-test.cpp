#include "DNS-cursor.hpp"

#include "DNS-error.hpp"
#include "DNS-iostream.hpp"

#include <gflags/gflags.h>

#include <glog/logging.h>

namespace {
template <typename Fn>
DNS::errc error_of(Fn fn)
{
  try {
    fn();
  }
  catch (DNS::parse_error const& ex) {
    LOG(INFO) << ex.what();
    return ex.code();
  }
  LOG(FATAL) << "expected a parse_error";
  return DNS::errc::misuse;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  using DNS::errc;
  using DNS::octet;

  static_assert(DNS::as_u16(0xAB, 0xCD) == 0xABCD);

  // clang-format off
  octet const bytes[]{
    0x12, 0x34, 0x56, 0x78, 0x9a, 0xbc, 0xde, 0xf0,
    0x00, 0x01, // A
    0x00, 0x03, // unassigned
  };
  // clang-format on

  DNS::cursor cur{bytes};
  CHECK_EQ(cur.remaining(), sizeof(bytes));

  CHECK_EQ(cur.read_u8(), 0x12);
  CHECK_EQ(cur.read_u16(), 0x3456);
  CHECK_EQ(cur.read_u32(), 0x789abcdeu);
  CHECK_EQ(cur.pos(), 7u);
  CHECK_EQ(cur.remaining(), 5u);

  // A window can't see past its length, or past its parent's end.
  auto win = cur.window(2);
  CHECK_EQ(win.remaining(), 2u);
  CHECK_EQ(win.read_u16(), 0xf000);
  CHECK_EQ(error_of([&] { win.read_u8(); }), errc::truncated);
  CHECK_EQ(win.pos(), 9u);

  CHECK_EQ(cur.window(100).remaining(), 5u);

  // but it may go back to an earlier part of the message
  win.seek(0);
  CHECK_EQ(win.read_u8(), 0x12);
  win.seek(9);
  CHECK_EQ(error_of([&] { win.seek(10); }), errc::truncated);

  // the parent is where it was
  CHECK_EQ(cur.pos(), 7u);
  cur.skip(1);

  CHECK(cur.read_type() == DNS::RR_type::A);
  CHECK_EQ(error_of([&] { cur.read_type(); }), errc::invalid_value);
  CHECK_EQ(cur.remaining(), 0u);
  CHECK_EQ(error_of([&] { cur.read_u8(); }), errc::truncated);
  CHECK_EQ(error_of([&] { cur.skip(1); }), errc::truncated);

  DNS::cursor c2{bytes};
  auto const three = c2.read_bytes(3);
  CHECK_EQ(three.size(), 3u);
  CHECK_EQ(three[2], 0x56);
  CHECK_EQ(error_of([&] { c2.read_bytes(20); }), errc::truncated);
  CHECK_EQ(c2.pos(), 3u);
  CHECK_EQ(error_of([&] { c2.read_u32(); c2.read_u32(); c2.read_u16(); }),
           errc::truncated);

  // clang-format off
  octet const classes[]{
    0x00, 0x01, // IN
    0x00, 0xff, // ANY
    0x00, 0x07, // unassigned
  };
  // clang-format on

  DNS::cursor c3{classes};
  CHECK(c3.read_class() == DNS::RR_class::IN);
  CHECK(c3.read_class() == DNS::RR_class::ANY);
  CHECK_EQ(error_of([&] { c3.read_class(); }), errc::invalid_value);

  DNS::cursor empty{std::span<octet const>{}};
  CHECK_EQ(error_of([&] { empty.read_u16(); }), errc::truncated);
}
