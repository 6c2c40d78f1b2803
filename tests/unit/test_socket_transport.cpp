#include "transport/SocketTransport.hpp"

#include "common/Errors.hpp"
#include "wire/Message.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace rfc2136::common;
using rfc2136::transport::SocketTransport;

namespace {

using Clock = std::chrono::steady_clock;

/// Loopback socket bound to an ephemeral port.
class LoopbackSocket {
 public:
  explicit LoopbackSocket(int iType) {
    _iFd = ::socket(AF_INET, iType, 0);
    sockaddr_in saAddr{};
    saAddr.sin_family = AF_INET;
    saAddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    saAddr.sin_port = 0;
    ::bind(_iFd, reinterpret_cast<sockaddr*>(&saAddr), sizeof(saAddr));
    socklen_t slLen = sizeof(saAddr);
    ::getsockname(_iFd, reinterpret_cast<sockaddr*>(&saAddr), &slLen);
    _uPort = ntohs(saAddr.sin_port);
  }
  ~LoopbackSocket() {
    if (_iFd >= 0) ::close(_iFd);
  }
  LoopbackSocket(const LoopbackSocket&) = delete;
  LoopbackSocket& operator=(const LoopbackSocket&) = delete;

  int fd() const { return _iFd; }
  std::string address() const { return "127.0.0.1:" + std::to_string(_uPort); }

 private:
  int _iFd = -1;
  uint16_t _uPort = 0;
};

std::vector<uint8_t> makeRequest(uint16_t uId) {
  rfc2136::wire::Message msg;
  msg.uId = uId;
  msg.vQuestions.push_back({"example.org.", 255, 1});
  return msg.encode();
}

std::vector<uint8_t> makeReply(uint16_t uId) {
  rfc2136::wire::Message msg;
  msg.uId = uId;
  msg.bResponse = true;
  return msg.encode();
}

}  // namespace

TEST(SocketTransportTest, UdpRoundTripSkipsForeignIds) {
  LoopbackSocket lsServer(SOCK_DGRAM);
  auto fuServer = std::async(std::launch::async, [&lsServer] {
    std::vector<uint8_t> vBuffer(512);
    sockaddr_in saPeer{};
    socklen_t slLen = sizeof(saPeer);
    const ssize_t iRead = ::recvfrom(lsServer.fd(), vBuffer.data(), vBuffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&saPeer), &slLen);
    if (iRead < 2) return;
    const uint16_t uId = static_cast<uint16_t>((vBuffer[0] << 8) | vBuffer[1]);
    for (const auto& vReply : {makeReply(static_cast<uint16_t>(uId + 1)), makeReply(uId)}) {
      ::sendto(lsServer.fd(), vReply.data(), vReply.size(), 0,
               reinterpret_cast<sockaddr*>(&saPeer), slLen);
    }
  });

  SocketTransport st(TransportKind::Udp, std::chrono::milliseconds(2000));
  const auto vReply = st.roundTrip(makeRequest(0x5151), lsServer.address(), {});
  fuServer.get();
  EXPECT_EQ(rfc2136::wire::peekId(vReply), 0x5151);
}

TEST(SocketTransportTest, TcpRoundTripUsesLengthFraming) {
  LoopbackSocket lsServer(SOCK_STREAM);
  ASSERT_EQ(::listen(lsServer.fd(), 1), 0);

  auto fuServer = std::async(std::launch::async, [&lsServer] {
    const int iConn = ::accept(lsServer.fd(), nullptr, nullptr);
    if (iConn < 0) return std::vector<uint8_t>{};
    uint8_t vLength[2];
    ::recv(iConn, vLength, 2, MSG_WAITALL);
    std::vector<uint8_t> vRequest((vLength[0] << 8) | vLength[1]);
    ::recv(iConn, vRequest.data(), vRequest.size(), MSG_WAITALL);

    const auto vReply = makeReply(static_cast<uint16_t>((vRequest[0] << 8) | vRequest[1]));
    const uint8_t vReplyLength[2] = {static_cast<uint8_t>(vReply.size() >> 8),
                                     static_cast<uint8_t>(vReply.size() & 0xFF)};
    ::send(iConn, vReplyLength, 2, 0);
    ::send(iConn, vReply.data(), vReply.size(), 0);
    ::close(iConn);
    return vRequest;
  });

  SocketTransport st(TransportKind::Tcp, std::chrono::milliseconds(2000));
  const auto vRequest = makeRequest(0x7777);
  const auto vReply = st.roundTrip(vRequest, lsServer.address(), {});
  EXPECT_EQ(fuServer.get(), vRequest);
  EXPECT_EQ(rfc2136::wire::peekId(vReply), 0x7777);
}

TEST(SocketTransportTest, SilentServerTimesOut) {
  LoopbackSocket lsServer(SOCK_DGRAM);
  SocketTransport st(TransportKind::Udp, std::chrono::milliseconds(250));

  const auto tpStart = Clock::now();
  try {
    st.roundTrip(makeRequest(1), lsServer.address(), {});
    FAIL() << "expected NetworkError";
  } catch (const NetworkError& e) {
    EXPECT_EQ(e._sErrorCode, "network_failure");
  }
  EXPECT_GE(Clock::now() - tpStart, std::chrono::milliseconds(250));
}

TEST(SocketTransportTest, StopRequestCancelsWait) {
  LoopbackSocket lsServer(SOCK_DGRAM);
  SocketTransport st(TransportKind::Udp, std::chrono::seconds(30));

  std::stop_source ssSource;
  std::jthread jtCanceller([&ssSource] {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    ssSource.request_stop();
  });

  const auto tpStart = Clock::now();
  EXPECT_THROW(st.roundTrip(makeRequest(2), lsServer.address(), ssSource.get_token()),
               CancelledError);
  EXPECT_LT(Clock::now() - tpStart, std::chrono::seconds(5));
}

TEST(SocketTransportTest, AlreadyStoppedTokenCancelsImmediately) {
  LoopbackSocket lsServer(SOCK_DGRAM);
  SocketTransport st(TransportKind::Udp, std::chrono::seconds(30));
  std::stop_source ssSource;
  ssSource.request_stop();
  EXPECT_THROW(st.roundTrip(makeRequest(3), lsServer.address(), ssSource.get_token()),
               CancelledError);
}

TEST(SocketTransportTest, HostnamesAreRejected) {
  SocketTransport st(TransportKind::Udp, std::chrono::milliseconds(250));
  EXPECT_THROW(st.roundTrip(makeRequest(4), "ns.example.org:53", {}), NetworkError);
  EXPECT_THROW(st.roundTrip(makeRequest(4), "127.0.0.1", {}), NetworkError);
  EXPECT_THROW(st.roundTrip(makeRequest(4), "", {}), NetworkError);
}

TEST(SocketTransportTest, RefusedTcpConnectionIsNetworkError) {
  std::string sAddress;
  {
    // Bound but not listening: connections are refused
    LoopbackSocket lsClosed(SOCK_STREAM);
    sAddress = lsClosed.address();
  }
  SocketTransport st(TransportKind::Tcp, std::chrono::milliseconds(1000));
  EXPECT_THROW(st.roundTrip(makeRequest(5), sAddress, {}), NetworkError);
}
