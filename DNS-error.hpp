#ifndef DNS_ERROR_DOT_HPP
#define DNS_ERROR_DOT_HPP

#include <stdexcept>
#include <string>

namespace DNS {

enum class errc {
  truncated,     // read past the end of the message or of an RDATA window
  invalid_value, // unassigned TYPE, CLASS, OPCODE or RCODE
  bad_pointer,   // forward or self compression pointer, reserved label type
  structure,     // RDLENGTH mismatch, trailing bytes, extra OPT, ...
  bad_name,      // label or name syntax, length or IDNA failure
  misuse,        // a message that can't be put on the wire as given
};

constexpr char const* errc_c_str(errc e)
{
  switch (e) { // clang-format off
  case errc::truncated:     return "truncated";
  case errc::invalid_value: return "invalid value";
  case errc::bad_pointer:   return "invalid compressed pointer";
  case errc::structure:     return "structure mismatch";
  case errc::bad_name:      return "invalid domain name";
  case errc::misuse:        return "misuse";
  } // clang-format on
  return "*** unknown errc ***";
}

class error : public std::runtime_error {
public:
  error(errc code, std::string const& what)
    : std::runtime_error(what)
    , code_(code)
  {
  }

  errc code() const { return code_; }

private:
  errc code_;
};

// Malformed wire data.
class parse_error : public error {
public:
  using error::error;
};

// Something in a message that can't be encoded.
class encode_error : public error {
public:
  using error::error;
};

} // namespace DNS

#endif // DNS_ERROR_DOT_HPP
