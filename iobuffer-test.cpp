#include "iobuffer.hpp"

#include <span>

#include <glog/logging.h>

const auto N = 100'000;

int main()
{
  iobuffer<char> v;

  // fill v with values [0..N-1]
  v.resize(N);
  for (size_t i = 0; i < N; ++i)
    *(v.data() + i) = i & 0x7F;

  // chop off the end, and the front half stays
  v.resize(N / 2);
  CHECK_EQ(v.size(), N / 2);
  for (size_t i = 0; i < N / 2; ++i) {
    CHECK_EQ(*(v.data() + i), i & 0x7F);
  }

  iobuffer<char> q(std::move(v));

  CHECK_EQ(q.size(), N / 2);
  for (size_t i = 0; i < N / 2; ++i) {
    CHECK_EQ(*(q.data() + i), i & 0x7F);
  }

  // network byte order
  iobuffer<uint8_t> b;
  b.put_u8(0x01);
  b.put_u16(0x0203);
  b.put_u32(0x04050607);
  CHECK_EQ(b.size(), 7u);
  for (size_t i = 0; i < b.size(); ++i) {
    CHECK_EQ(*(b.data() + i), i + 1);
  }

  // a length written after what it counts
  auto const pos = b.size();
  b.put_u16(0);
  uint8_t const payload[]{0xAA, 0xBB, 0xCC};
  b.append(payload, sizeof(payload));
  b.set_u16(pos, sizeof(payload));
  CHECK_EQ(b.size(), 12u);
  CHECK_EQ(*(b.data() + pos), 0);
  CHECK_EQ(*(b.data() + pos + 1), 3);
  CHECK_EQ(*(b.data() + 11), 0xCC);

  std::span<uint8_t const> const sp = b;
  CHECK_EQ(sp.size(), b.size());
  CHECK(sp.data() == b.data());

  iobuffer<uint8_t> c;
  c.append(b.data(), b.size());
  CHECK(c == b);
  c.set_u16(0, 0xFFFF);
  CHECK(!(c == b));
  CHECK(b < c);

  iobuffer<uint8_t> shorter;
  shorter.put_u8(0xFF);
  CHECK(shorter < b);

  c.clear();
  CHECK(c.empty());
}
