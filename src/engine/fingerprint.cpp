#include "quota_cache/fingerprint.hpp"

#include <sstream>

namespace quota_cache {
namespace {
void append_escaped(std::string &out, const std::string &s) {
  for (char c : s) {
    switch (c) {
    case '%':
      out += "%25";
      break;
    case '&':
      out += "%26";
      break;
    case '=':
      out += "%3D";
      break;
    default:
      out.push_back(c);
    }
  }
}
} // namespace

std::string canonical_query(const std::string &family,
                            const QueryParams &params) {
  std::string out = family;
  out.push_back('?');
  bool first = true;
  // std::map iterates in key order, which makes the result independent of
  // the order the caller inserted parameters.
  for (const auto &[name, value] : params) {
    if (value.empty())
      continue;
    if (!first)
      out.push_back('&');
    first = false;
    append_escaped(out, name);
    out.push_back('=');
    append_escaped(out, value);
  }
  return out;
}

Fingerprint make_fingerprint(const std::string &family,
                             const QueryParams &params) {
  Fingerprint fp;
  fp.family = family;
  fp.canonical = canonical_query(family, params);
  fp.key = family + ":" + fnv1a_hex(fp.canonical);
  return fp;
}

std::string fnv1a_hex(const std::string &data) {
  std::uint64_t h = 1469598103934665603ULL;
  for (unsigned char b : data) {
    h ^= static_cast<std::uint64_t>(b);
    h *= 1099511628211ULL;
  }
  std::ostringstream os;
  os << std::hex << h;
  return os.str();
}

} // namespace quota_cache
