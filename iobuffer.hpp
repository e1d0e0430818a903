#ifndef IOBUFFER_DOT_HPP
#define IOBUFFER_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

#include <glog/logging.h>

// A byte buffer that grows at the end, with big-endian (network order)
// writers and in-place patching for length fields written before their
// value is known.

template <typename ByteT = std::byte>
class iobuffer {
public:
  using buffer_t  = std::vector<ByteT>;
  using size_type = typename buffer_t::size_type;

  iobuffer() = default;
  explicit iobuffer(size_type sz)
    : buf_(sz)
  {
  }

  auto data() { return buf_.data(); }
  auto data() const { return buf_.data(); }
  auto size() const { return buf_.size(); }
  bool empty() const { return buf_.empty(); }
  auto resize(size_type sz) { return buf_.resize(sz); }
  void reserve(size_type sz) { buf_.reserve(sz); }
  void clear() { buf_.clear(); }

  auto begin() const { return buf_.begin(); }
  auto end() const { return buf_.end(); }

  operator std::span<ByteT const>() const { return {buf_.data(), buf_.size()}; }

  void append(ByteT const* p, size_type n) { buf_.insert(buf_.end(), p, p + n); }

  void put_u8(uint8_t n) { buf_.push_back(static_cast<ByteT>(n)); }

  void put_u16(uint16_t n)
  {
    put_u8((n >> 8) & 0xFF);
    put_u8(n & 0xFF);
  }

  void put_u32(uint32_t n)
  {
    put_u16((n >> 16) & 0xFFFF);
    put_u16(n & 0xFFFF);
  }

  // overwrite two octets already in the buffer
  void set_u16(size_type pos, uint16_t n)
  {
    CHECK_LE(pos + 2, size());
    buf_[pos]     = static_cast<ByteT>((n >> 8) & 0xFF);
    buf_[pos + 1] = static_cast<ByteT>(n & 0xFF);
  }

  bool operator==(iobuffer const& rhs) const
  {
    if (this->size() == rhs.size())
      return memcmp(this->data(), rhs.data(), this->size()) == 0;
    return false;
  }

  bool operator<(iobuffer const& rhs) const
  {
    if (this->size() == rhs.size())
      return memcmp(this->data(), rhs.data(), this->size()) < 0;
    return this->size() < rhs.size();
  }

private:
  buffer_t buf_;
};

#endif // IOBUFFER_DOT_HPP
