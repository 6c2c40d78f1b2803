#pragma once

#include <chrono>

#include "common/Types.hpp"
#include "transport/ITransport.hpp"

namespace rfc2136::transport {

/// BSD socket transport over UDP or TCP (2-octet length framing).
/// Every wait is a bounded poll() slice so a stop request is noticed within
/// one slice. Nameserver addresses must be literal IPs.
/// Class abbreviation: st
class SocketTransport : public ITransport {
 public:
  SocketTransport(common::TransportKind tkKind, std::chrono::milliseconds durTimeout);
  ~SocketTransport() override = default;

  std::vector<uint8_t> roundTrip(const std::vector<uint8_t>& vRequest,
                                 const std::string& sAddress,
                                 std::stop_token stToken) override;

  static constexpr std::chrono::milliseconds kPollSlice{100};

 private:
  std::vector<uint8_t> roundTripUdp(int iFd, const std::vector<uint8_t>& vRequest,
                                    std::chrono::steady_clock::time_point tpDeadline,
                                    std::stop_token& stToken);
  std::vector<uint8_t> roundTripTcp(int iFd, const std::vector<uint8_t>& vRequest,
                                    std::chrono::steady_clock::time_point tpDeadline,
                                    std::stop_token& stToken);

  common::TransportKind _tkKind;
  std::chrono::milliseconds _durTimeout;
};

}  // namespace rfc2136::transport
