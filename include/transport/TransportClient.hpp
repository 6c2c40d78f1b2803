#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

#include "security/TsigSigner.hpp"
#include "transport/ITransport.hpp"
#include "wire/Message.hpp"

namespace rfc2136::transport {

/// Signed request/reply exchange with reply classification.
/// Identical concurrent requests (same destination, same bytes apart from the
/// message ID) share one network exchange and its outcome.
/// Class abbreviation: tc
class TransportClient {
 public:
  /// spSigner may be null, in which case requests go out unsigned and replies
  /// are not verified.
  TransportClient(std::shared_ptr<ITransport> spTransport,
                  std::shared_ptr<const security::TsigSigner> spSigner);

  /// Assigns a fresh message ID, signs, sends and classifies the reply.
  /// Throws NetworkError, CancelledError, MalformedMessageError,
  /// ServerRejectedError (rcode != NOERROR or a TSIG error) or TsigError.
  wire::Message exchange(const wire::Message& msgRequest, const std::string& sAddress,
                         std::stop_token stToken);

  static constexpr std::chrono::milliseconds kFollowerPoll{50};

 private:
  wire::Message performExchange(const wire::Message& msgRequest, const std::string& sAddress,
                                std::stop_token stToken);

  static uint16_t randomId();

  std::shared_ptr<ITransport> _spTransport;
  std::shared_ptr<const security::TsigSigner> _spSigner;

  std::mutex _mtxInflight;
  std::map<std::string, std::shared_future<wire::Message>> _mInflight;
};

}  // namespace rfc2136::transport
