#include "transport/SocketTransport.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "wire/Message.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

namespace rfc2136::transport {

namespace {

constexpr std::size_t kMaxUdpPayload = 65535;

using Clock = std::chrono::steady_clock;

/// Closes the descriptor on scope exit.
class FdGuard {
 public:
  explicit FdGuard(int iFd) : _iFd(iFd) {}
  ~FdGuard() {
    if (_iFd >= 0) ::close(_iFd);
  }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return _iFd; }

 private:
  int _iFd;
};

struct AddrInfoDeleter {
  void operator()(addrinfo* pInfo) const { freeaddrinfo(pInfo); }
};

std::string errnoText(const std::string& sWhat) {
  return sWhat + ": " + std::strerror(errno);
}

/// Splits "host:port" or "[v6]:port" into its parts.
void splitHostPort(const std::string& sAddress, std::string& sHost, std::string& sPort) {
  if (!sAddress.empty() && sAddress.front() == '[') {
    const auto nClose = sAddress.find(']');
    if (nClose == std::string::npos || nClose + 1 >= sAddress.size() ||
        sAddress[nClose + 1] != ':') {
      throw common::NetworkError("cannot parse nameserver address '" + sAddress + "'");
    }
    sHost = sAddress.substr(1, nClose - 1);
    sPort = sAddress.substr(nClose + 2);
    return;
  }
  const auto nColon = sAddress.rfind(':');
  if (nColon == std::string::npos || sAddress.find(':') != nColon) {
    throw common::NetworkError("cannot parse nameserver address '" + sAddress + "'");
  }
  sHost = sAddress.substr(0, nColon);
  sPort = sAddress.substr(nColon + 1);
}

std::unique_ptr<addrinfo, AddrInfoDeleter> resolveLiteral(const std::string& sAddress,
                                                          int iSockType) {
  std::string sHost;
  std::string sPort;
  splitHostPort(sAddress, sHost, sPort);

  addrinfo aiHints{};
  aiHints.ai_family = AF_UNSPEC;
  aiHints.ai_socktype = iSockType;
  aiHints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

  addrinfo* pResult = nullptr;
  const int iRc = getaddrinfo(sHost.c_str(), sPort.c_str(), &aiHints, &pResult);
  if (iRc != 0 || pResult == nullptr) {
    throw common::NetworkError("nameserver address '" + sAddress +
                               "' is not a literal IP and port: " + gai_strerror(iRc));
  }
  return std::unique_ptr<addrinfo, AddrInfoDeleter>(pResult);
}

/// Waits until iFd is ready for iEvents, in kPollSlice steps.
void waitReady(int iFd, short iEvents, Clock::time_point tpDeadline, std::stop_token& stToken) {
  for (;;) {
    if (stToken.stop_requested()) {
      throw common::CancelledError("exchange cancelled");
    }
    const auto durLeft =
        std::chrono::duration_cast<std::chrono::milliseconds>(tpDeadline - Clock::now());
    if (durLeft.count() <= 0) {
      throw common::NetworkError("timed out waiting for nameserver");
    }
    const auto durSlice = std::min(durLeft, SocketTransport::kPollSlice);

    pollfd pfd{};
    pfd.fd = iFd;
    pfd.events = iEvents;
    const int iRc = ::poll(&pfd, 1, static_cast<int>(durSlice.count()));
    if (iRc < 0) {
      if (errno == EINTR) continue;
      throw common::NetworkError(errnoText("poll failed"));
    }
    if (iRc > 0) return;
  }
}

void sendAll(int iFd, const uint8_t* pData, std::size_t nSize, Clock::time_point tpDeadline,
             std::stop_token& stToken) {
  std::size_t nSent = 0;
  while (nSent < nSize) {
    waitReady(iFd, POLLOUT, tpDeadline, stToken);
    const ssize_t iRc = ::send(iFd, pData + nSent, nSize - nSent, MSG_NOSIGNAL);
    if (iRc < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      throw common::NetworkError(errnoText("send failed"));
    }
    nSent += static_cast<std::size_t>(iRc);
  }
}

void recvAll(int iFd, uint8_t* pData, std::size_t nSize, Clock::time_point tpDeadline,
             std::stop_token& stToken) {
  std::size_t nRead = 0;
  while (nRead < nSize) {
    waitReady(iFd, POLLIN, tpDeadline, stToken);
    const ssize_t iRc = ::recv(iFd, pData + nRead, nSize - nRead, 0);
    if (iRc < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      throw common::NetworkError(errnoText("recv failed"));
    }
    if (iRc == 0) {
      throw common::NetworkError("nameserver closed the connection mid-reply");
    }
    nRead += static_cast<std::size_t>(iRc);
  }
}

}  // anonymous namespace

SocketTransport::SocketTransport(common::TransportKind tkKind,
                                 std::chrono::milliseconds durTimeout)
    : _tkKind(tkKind), _durTimeout(durTimeout) {}

std::vector<uint8_t> SocketTransport::roundTrip(const std::vector<uint8_t>& vRequest,
                                                const std::string& sAddress,
                                                std::stop_token stToken) {
  if (vRequest.size() < wire::kHeaderSize) {
    throw common::NetworkError("refusing to send a message without a header");
  }
  const bool bTcp = _tkKind == common::TransportKind::Tcp;
  const auto tpDeadline = Clock::now() + _durTimeout;

  auto upInfo = resolveLiteral(sAddress, bTcp ? SOCK_STREAM : SOCK_DGRAM);

  FdGuard fgSocket(::socket(upInfo->ai_family, upInfo->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                            upInfo->ai_protocol));
  if (fgSocket.get() < 0) {
    throw common::NetworkError(errnoText("socket failed"));
  }

  if (::connect(fgSocket.get(), upInfo->ai_addr, upInfo->ai_addrlen) < 0) {
    if (errno != EINPROGRESS) {
      throw common::NetworkError(errnoText("connect to " + sAddress + " failed"));
    }
    waitReady(fgSocket.get(), POLLOUT, tpDeadline, stToken);
    int iSoError = 0;
    socklen_t slLen = sizeof(iSoError);
    if (::getsockopt(fgSocket.get(), SOL_SOCKET, SO_ERROR, &iSoError, &slLen) < 0) {
      throw common::NetworkError(errnoText("getsockopt failed"));
    }
    if (iSoError != 0) {
      throw common::NetworkError("connect to " + sAddress + " failed: " +
                                 std::strerror(iSoError));
    }
  }

  common::Logger::get()->trace("{} exchange with {}: {} octet request", bTcp ? "TCP" : "UDP",
                               sAddress, vRequest.size());

  return bTcp ? roundTripTcp(fgSocket.get(), vRequest, tpDeadline, stToken)
              : roundTripUdp(fgSocket.get(), vRequest, tpDeadline, stToken);
}

std::vector<uint8_t> SocketTransport::roundTripUdp(int iFd, const std::vector<uint8_t>& vRequest,
                                                   Clock::time_point tpDeadline,
                                                   std::stop_token& stToken) {
  sendAll(iFd, vRequest.data(), vRequest.size(), tpDeadline, stToken);

  const uint16_t uId = wire::peekId(vRequest);
  std::vector<uint8_t> vBuffer(kMaxUdpPayload);
  for (;;) {
    waitReady(iFd, POLLIN, tpDeadline, stToken);
    const ssize_t iRc = ::recv(iFd, vBuffer.data(), vBuffer.size(), 0);
    if (iRc < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      throw common::NetworkError(errnoText("recv failed"));
    }
    std::vector<uint8_t> vReply(vBuffer.begin(), vBuffer.begin() + iRc);
    if (vReply.size() >= 2 && wire::peekId(vReply) == uId) {
      return vReply;
    }
    common::Logger::get()->debug("Discarding UDP datagram with foreign id ({} octets)",
                                 vReply.size());
  }
}

std::vector<uint8_t> SocketTransport::roundTripTcp(int iFd, const std::vector<uint8_t>& vRequest,
                                                   Clock::time_point tpDeadline,
                                                   std::stop_token& stToken) {
  if (vRequest.size() > 0xFFFF) {
    throw common::NetworkError("message too large for TCP framing");
  }
  std::vector<uint8_t> vFramed;
  vFramed.reserve(vRequest.size() + 2);
  vFramed.push_back(static_cast<uint8_t>(vRequest.size() >> 8));
  vFramed.push_back(static_cast<uint8_t>(vRequest.size() & 0xFF));
  vFramed.insert(vFramed.end(), vRequest.begin(), vRequest.end());
  sendAll(iFd, vFramed.data(), vFramed.size(), tpDeadline, stToken);

  uint8_t vLength[2];
  recvAll(iFd, vLength, sizeof(vLength), tpDeadline, stToken);
  const std::size_t nLength = (static_cast<std::size_t>(vLength[0]) << 8) | vLength[1];

  std::vector<uint8_t> vReply(nLength);
  recvAll(iFd, vReply.data(), nLength, tpDeadline, stToken);
  return vReply;
}

}  // namespace rfc2136::transport
