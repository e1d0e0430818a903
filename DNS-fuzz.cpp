// libFuzzer entry point: any input must decode or throw a parse_error.

#include "DNS-error.hpp"
#include "DNS-message.hpp"

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(uint8_t const* data, size_t size)
{
  try {
    DNS::decode({data, size});
  }
  catch (DNS::parse_error const&) {
  }
  return 0;
}
