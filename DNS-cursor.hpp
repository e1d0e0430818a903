#ifndef DNS_CURSOR_DOT_HPP
#define DNS_CURSOR_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <span>

#include "DNS-types.hpp"

namespace DNS {

constexpr uint16_t as_u16(octet hi, octet lo)
{
  return (uint16_t(hi) << 8) + lo;
}

// A read position into a whole DNS message. Every read is checked
// against end(), which is the end of the message or, for a window, the
// end of one record's RDATA. Offsets are always relative to the start
// of the message, so compression pointers can be followed from inside
// a window.

class cursor {
public:
  explicit cursor(std::span<octet const> msg)
    : msg_(msg)
    , end_(msg.size())
  {
  }

  size_t pos() const { return pos_; }
  size_t end() const { return end_; }
  size_t remaining() const { return end_ - pos_; }

  uint8_t  read_u8();
  uint16_t read_u16();
  uint32_t read_u32();

  std::span<octet const> read_bytes(size_t n);

  void skip(size_t n);

  // Move to any offset up to end(), including backwards past the
  // position this cursor started at.
  void seek(size_t pos);

  // A cursor at pos() that can read at most len octets, clamped to
  // this cursor's end().
  cursor window(size_t len) const;

  RR_type  read_type();
  RR_class read_class();

private:
  cursor(std::span<octet const> msg, size_t pos, size_t end)
    : msg_(msg)
    , pos_(pos)
    , end_(end)
  {
  }

  void need_(size_t n) const;

  std::span<octet const> msg_;

  size_t pos_{0};
  size_t end_;
};

} // namespace DNS

#endif // DNS_CURSOR_DOT_HPP
