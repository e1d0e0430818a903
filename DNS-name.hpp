#ifndef DNS_NAME_DOT_HPP
#define DNS_NAME_DOT_HPP

#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "DNS-cursor.hpp"
#include "DNS-types.hpp"
#include "iobuffer.hpp"

namespace DNS {

// Decode the (possibly compressed) name at cur.pos(), leaving cur just
// past the octets the name occupies at that position. The result is
// Unicode, always ends with a dot, and is "." for the root. Literal
// dots and backslashes inside a label come back escaped with '\'.
std::string read_name(cursor& cur);

// Same, for a name at offset within msg; also returns the number of
// octets the name occupies at offset (two for a bare pointer).
std::pair<std::string, size_t> read_name(std::span<octet const> msg,
                                         size_t                 offset);

// Append name in uncompressed wire form. Labels that aren't ASCII are
// converted to A-labels; "\." and "\\" escape a dot or backslash within
// a label. Empty and "." both write the root.
void write_name(iobuffer<octet>& out, std::string_view name);

} // namespace DNS

#endif // DNS_NAME_DOT_HPP
