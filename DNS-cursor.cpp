#include "DNS-cursor.hpp"

#include "DNS-error.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace DNS {

void cursor::need_(size_t n) const
{
  if (n > remaining()) {
    throw parse_error(errc::truncated,
                      fmt::format("need {} octets at offset {}, only {} left",
                                  n, pos_, remaining()));
  }
}

uint8_t cursor::read_u8()
{
  need_(1);
  return msg_[pos_++];
}

uint16_t cursor::read_u16()
{
  need_(2);
  auto const n = as_u16(msg_[pos_], msg_[pos_ + 1]);
  pos_ += 2;
  return n;
}

uint32_t cursor::read_u32()
{
  need_(4);
  auto const n = (uint32_t(msg_[pos_]) << 24) + (uint32_t(msg_[pos_ + 1]) << 16) +
                 (uint32_t(msg_[pos_ + 2]) << 8) + (uint32_t(msg_[pos_ + 3]));
  pos_ += 4;
  return n;
}

std::span<octet const> cursor::read_bytes(size_t n)
{
  need_(n);
  auto const bytes = msg_.subspan(pos_, n);
  pos_ += n;
  return bytes;
}

void cursor::skip(size_t n)
{
  need_(n);
  pos_ += n;
}

void cursor::seek(size_t pos)
{
  if (pos > end_) {
    throw parse_error(errc::truncated,
                      fmt::format("seek to offset {} past end {}", pos, end_));
  }
  pos_ = pos;
}

cursor cursor::window(size_t len) const
{
  auto const end = std::min(end_, pos_ + std::min(len, remaining()));
  return cursor{msg_, pos_, end};
}

RR_type cursor::read_type()
{
  auto const n   = read_u16();
  auto const typ = RR_type_from_u16(n);
  if (!typ)
    throw parse_error(errc::invalid_value, fmt::format("invalid Type({})", n));
  return *typ;
}

RR_class cursor::read_class()
{
  auto const n   = read_u16();
  auto const cls = RR_class_from_u16(n);
  if (!cls)
    throw parse_error(errc::invalid_value, fmt::format("invalid Class({})", n));
  return *cls;
}

} // namespace DNS
