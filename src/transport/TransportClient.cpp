#include "transport/TransportClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "wire/RecordType.hpp"

#include <openssl/rand.h>

#include <chrono>
#include <stdexcept>

namespace rfc2136::transport {

TransportClient::TransportClient(std::shared_ptr<ITransport> spTransport,
                                 std::shared_ptr<const security::TsigSigner> spSigner)
    : _spTransport(std::move(spTransport)), _spSigner(std::move(spSigner)) {
  if (!_spTransport) {
    throw common::ValidationError("TransportClient requires a transport");
  }
}

uint16_t TransportClient::randomId() {
  unsigned char vBytes[2];
  if (RAND_bytes(vBytes, sizeof(vBytes)) != 1) {
    throw std::runtime_error("Failed to generate random message ID");
  }
  return static_cast<uint16_t>((vBytes[0] << 8) | vBytes[1]);
}

wire::Message TransportClient::exchange(const wire::Message& msgRequest,
                                        const std::string& sAddress, std::stop_token stToken) {
  // Coalescing key: destination plus the request with its ID zeroed
  std::vector<uint8_t> vKeyBytes = msgRequest.encode();
  wire::pokeId(vKeyBytes, 0);
  std::string sKey = sAddress;
  sKey.push_back('\0');
  sKey.append(vKeyBytes.begin(), vKeyBytes.end());

  std::promise<wire::Message> prReply;
  std::shared_future<wire::Message> sfReply;
  bool bLeader = false;
  {
    std::lock_guard<std::mutex> lock(_mtxInflight);
    auto it = _mInflight.find(sKey);
    if (it != _mInflight.end()) {
      sfReply = it->second;
    } else {
      sfReply = prReply.get_future().share();
      _mInflight.emplace(sKey, sfReply);
      bLeader = true;
    }
  }

  if (!bLeader) {
    common::Logger::get()->debug("Joining in-flight exchange with {}", sAddress);
    while (sfReply.wait_for(kFollowerPoll) != std::future_status::ready) {
      if (stToken.stop_requested()) {
        throw common::CancelledError("exchange cancelled while waiting for shared reply");
      }
    }
    return sfReply.get();
  }

  try {
    wire::Message msgReply = performExchange(msgRequest, sAddress, stToken);
    {
      std::lock_guard<std::mutex> lock(_mtxInflight);
      _mInflight.erase(sKey);
    }
    prReply.set_value(msgReply);
    return msgReply;
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(_mtxInflight);
      _mInflight.erase(sKey);
    }
    prReply.set_exception(std::current_exception());
    throw;
  }
}

wire::Message TransportClient::performExchange(const wire::Message& msgRequest,
                                               const std::string& sAddress,
                                               std::stop_token stToken) {
  auto spLog = common::Logger::get();

  wire::Message msgOut = msgRequest;
  msgOut.uId = randomId();
  std::vector<uint8_t> vRequest = msgOut.encode();

  std::vector<uint8_t> vRequestMac;
  if (_spSigner) {
    vRequestMac = _spSigner->sign(vRequest, std::chrono::system_clock::now());
  }

  spLog->debug("Sending id={} opcode={} ({} octets{}) to {}", msgOut.uId, msgOut.uOpcode,
               vRequest.size(), _spSigner ? ", TSIG" : "", sAddress);

  const std::vector<uint8_t> vReply = _spTransport->roundTrip(vRequest, sAddress, stToken);
  const wire::Message msgReply = wire::Message::decode(vReply);

  if (msgReply.uId != msgOut.uId) {
    throw common::MalformedMessageError("reply id " + std::to_string(msgReply.uId) +
                                        " does not match request id " +
                                        std::to_string(msgOut.uId));
  }
  if (!msgReply.bResponse) {
    throw common::MalformedMessageError("reply does not have the QR bit set");
  }

  spLog->debug("Received id={} rcode={} ({} octets) from {}", msgReply.uId,
               wire::rcodeToString(msgReply.iRcode), vReply.size(), sAddress);

  if (msgReply.iRcode != wire::kRcodeNoError) {
    // A TSIG error (BADSIG, BADKEY, BADTIME) is more specific than NOTAUTH
    if (const auto* pTsig = msgReply.tsigRecord()) {
      const auto& td = std::get<wire::TsigData>(pTsig->rdData);
      if (td.uError != 0) {
        const std::string sName = wire::rcodeToString(td.uError);
        throw common::ServerRejectedError(td.uError, sName,
                                          "nameserver rejected the request: " + sName);
      }
    }
    const std::string sName = wire::rcodeToString(msgReply.iRcode);
    throw common::ServerRejectedError(msgReply.iRcode, sName,
                                      "nameserver rejected the request: " + sName);
  }

  if (_spSigner) {
    _spSigner->verify(vReply, msgReply, std::chrono::system_clock::now(), vRequestMac);
  }
  return msgReply;
}

}  // namespace rfc2136::transport
