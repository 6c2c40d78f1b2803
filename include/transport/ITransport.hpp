#pragma once

#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>

namespace rfc2136::transport {

/// Raw request/reply exchange with a nameserver.
/// Implementations throw NetworkError on transport failure or timeout and
/// CancelledError once stToken is triggered.
class ITransport {
 public:
  virtual ~ITransport() = default;

  /// Sends vRequest to sAddress ("host:port" or "[v6]:port") and returns the
  /// first reply carrying the same message ID.
  virtual std::vector<uint8_t> roundTrip(const std::vector<uint8_t>& vRequest,
                                         const std::string& sAddress,
                                         std::stop_token stToken) = 0;
};

}  // namespace rfc2136::transport
