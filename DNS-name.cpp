#include "DNS-name.hpp"

#include "DNS-error.hpp"
#include "IDNA.hpp"
#include "esc.hpp"

#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(lenient_idna,
            false,
            "keep an xn-- label that fails IDNA decoding as raw ASCII");

namespace {
using DNS::octet;

auto constexpr compression_mask = octet(0xC0);

void append_label(std::string& name, std::span<octet const> label)
{
  std::string_view const text{reinterpret_cast<char const*>(label.data()),
                              label.size()};

  if (!IDNA::is_ascii(text)) {
    throw DNS::parse_error(DNS::errc::bad_name,
                           fmt::format("invalid label [{:02x}]: not valid ascii",
                                       fmt::join(label, " ")));
  }

  if (boost::algorithm::istarts_with(text, IDNA::ace_prefix)) {
    // A valid A-label is what its own U-label converts back to.
    std::string why;
    try {
      auto const u_label = IDNA::to_unicode(text);
      if (boost::algorithm::iequals(IDNA::to_ascii(u_label), text)) {
        name += u_label;
        name += '.';
        return;
      }
      why = fmt::format("decodes to «{}», which is not its U-label", esc(u_label));
    }
    catch (std::invalid_argument const& ex) {
      why = ex.what();
    }
    if (!FLAGS_lenient_idna) {
      throw DNS::parse_error(DNS::errc::bad_name,
                             fmt::format("invalid label '{}': {}", text, why));
    }
    LOG(WARNING) << "keeping undecodable label «" << esc(text) << "»: " << why;
  }

  for (auto const ch : text) {
    if (ch == '.' || ch == '\\')
      name += '\\';
    name += ch;
  }
  name += '.';
}

// Split on unescaped dots, removing the escapes.
std::vector<std::string> split_labels(std::string_view name)
{
  std::vector<std::string> labels;

  std::string label;
  auto        at_dot = false;
  for (auto p = name.begin(); p != name.end(); ++p) {
    if (*p == '.') {
      labels.push_back(std::move(label));
      label.clear();
      at_dot = true;
      continue;
    }
    if (*p == '\\' && (p + 1) != name.end())
      ++p;
    label += *p;
    at_dot = false;
  }

  // a final dot ends the name rather than starting another label
  if (!at_dot)
    labels.push_back(std::move(label));

  return labels;
}
} // namespace

namespace DNS {

std::string read_name(cursor& cur)
{
  std::string name;

  // Each pointer must point before the start of the name that contains
  // it, so limit strictly decreases and the loop terminates.
  auto limit = cur.pos();

  std::optional<size_t> resume;
  size_t                wire_len = 0;

  auto rd = cur;
  for (;;) {
    auto const len = rd.read_u8();
    if (len == 0)
      break;

    switch (len & compression_mask) {
    case 0x00: {
      auto const label = rd.read_bytes(len);
      wire_len += 1 + label.size();
      if (wire_len + 1 > Config::max_name_sz) {
        throw parse_error(errc::bad_name,
                          fmt::format("domain name at offset {} exceeds {} "
                                      "octets",
                                      cur.pos(), Config::max_name_sz));
      }
      append_label(name, label);
      break;
    }

    case compression_mask: {
      size_t const ptr = ((len & ~compression_mask) << 8) | rd.read_u8();
      if (ptr >= limit) {
        throw parse_error(errc::bad_pointer,
                          fmt::format("invalid compressed pointer to offset {} "
                                      "from a name starting at {}",
                                      ptr, limit));
      }
      if (!resume)
        resume = rd.pos();
      limit = ptr;
      rd.seek(ptr);
      break;
    }

    default:
      // RFC 1035 4.1.4 says other options (01, 10) for top 2
      // bits are reserved.
      throw parse_error(errc::bad_pointer,
                        fmt::format("unsupported compression type {:#04b}",
                                    (len & compression_mask) >> 6));
    }
  }

  cur.seek(resume ? *resume : rd.pos());

  if (name.empty())
    name = "."; // RFC 2181 says this should be ".": the root of the DNS tree.

  return name;
}

std::pair<std::string, size_t> read_name(std::span<octet const> msg,
                                         size_t                 offset)
{
  cursor cur{msg};
  cur.seek(offset);
  auto name = read_name(cur);
  return {std::move(name), cur.pos() - offset};
}

void write_name(iobuffer<octet>& out, std::string_view name)
{
  if (name.empty() || name == ".") {
    out.put_u8(0);
    return;
  }

  size_t wire_len = 0;

  for (auto label : split_labels(name)) {
    if (label.empty()) {
      throw encode_error(errc::bad_name,
                         fmt::format("empty label in domain name '{}'", name));
    }

    if (!IDNA::is_ascii(label)) {
      try {
        label = IDNA::to_ascii(label);
      }
      catch (std::invalid_argument const& ex) {
        throw encode_error(errc::bad_name,
                           fmt::format("invalid label '{}' in domain name "
                                       "'{}': {}",
                                       label, name, ex.what()));
      }
    }

    if (label.size() > Config::max_label_sz) {
      // RFC-1035 Section 2.3.4. Size limits
      throw encode_error(errc::bad_name,
                         fmt::format("label '{}' longer than {} characters",
                                     label, Config::max_label_sz));
    }

    wire_len += 1 + label.size();
    if (wire_len + 1 > Config::max_name_sz) {
      throw encode_error(errc::bad_name,
                         fmt::format("domain name '{}' exceeds {} octets", name,
                                     Config::max_name_sz));
    }

    out.put_u8(label.size());
    out.append(reinterpret_cast<octet const*>(label.data()), label.size());
  }

  // Add the zero-length label at the end.
  out.put_u8(0);
}

} // namespace DNS
