#pragma once

#include <string>

namespace rfc2136::core {

inline constexpr const char* kDefaultDnsPort = "53";

/// Normalizes a nameserver address to host:port.
/// Class abbreviation: N/A (static interface)
class NameserverResolver {
 public:
  /// "ns.example.org" -> "ns.example.org:53", "192.0.2.1:5353" unchanged,
  /// "::1" and "[::1]" -> "[::1]:53". Anything malformed is returned
  /// unchanged (and logged) so the transport reports the real cause.
  static std::string normalize(const std::string& sAddress);
};

}  // namespace rfc2136::core
