#include "transport/TransportClient.hpp"

#include "common/Errors.hpp"
#include "core/ZoneQueryEngine.hpp"
#include "support/FakeNameserver.hpp"
#include "wire/RecordType.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>

using namespace rfc2136::common;
using rfc2136::core::ZoneQueryEngine;
using rfc2136::security::TsigSigner;
using rfc2136::test_support::FakeNameserver;
using rfc2136::transport::ITransport;
using rfc2136::transport::TransportClient;
namespace wire = rfc2136::wire;

namespace {

const char* kAddress = "192.0.2.53:53";

/// Transport whose reply is computed by a test-supplied function.
class ScriptedTransport : public ITransport {
 public:
  explicit ScriptedTransport(std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)> fnReply)
      : _fnReply(std::move(fnReply)) {}

  std::vector<uint8_t> roundTrip(const std::vector<uint8_t>& vRequest,
                                 const std::string& /*sAddress*/,
                                 std::stop_token /*stToken*/) override {
    ++_iCalls;
    return _fnReply(vRequest);
  }

  int calls() const { return _iCalls.load(); }

 private:
  std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)> _fnReply;
  std::atomic<int> _iCalls{0};
};

/// Echoes the request back as an empty NOERROR reply, after fnMutate.
std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)> replyWith(
    std::function<void(wire::Message&)> fnMutate = {}) {
  return [fnMutate](const std::vector<uint8_t>& vRequest) {
    const auto msgRequest = wire::Message::decode(vRequest);
    wire::Message msgReply;
    msgReply.uId = msgRequest.uId;
    msgReply.bResponse = true;
    msgReply.uOpcode = msgRequest.uOpcode;
    msgReply.vQuestions = msgRequest.vQuestions;
    if (fnMutate) fnMutate(msgReply);
    return msgReply.encode();
  };
}

TsigConfig makeTsig(const std::string& sSecret = "MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWY=") {
  TsigConfig tc;
  tc.sKeyName = "update-key.example.org.";
  tc.sAlgorithm = "hmac-sha256";
  tc.sSecret = sSecret;
  return tc;
}

}  // namespace

TEST(TransportClientTest, RequiresTransport) {
  EXPECT_THROW(TransportClient(nullptr, nullptr), ValidationError);
}

TEST(TransportClientTest, SuccessfulExchangeReturnsReply) {
  auto spTransport = std::make_shared<ScriptedTransport>(replyWith());
  TransportClient tc(spTransport, nullptr);
  const auto msgReply =
      tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, std::stop_token{});
  EXPECT_TRUE(msgReply.bResponse);
  EXPECT_EQ(msgReply.iRcode, wire::kRcodeNoError);
  EXPECT_EQ(spTransport->calls(), 1);
}

TEST(TransportClientTest, MismatchedIdIsMalformed) {
  auto spTransport = std::make_shared<ScriptedTransport>(
      replyWith([](wire::Message& msg) { msg.uId = static_cast<uint16_t>(msg.uId + 1); }));
  TransportClient tc(spTransport, nullptr);
  EXPECT_THROW(tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {}),
               MalformedMessageError);
}

TEST(TransportClientTest, MissingQrBitIsMalformed) {
  auto spTransport = std::make_shared<ScriptedTransport>(
      replyWith([](wire::Message& msg) { msg.bResponse = false; }));
  TransportClient tc(spTransport, nullptr);
  EXPECT_THROW(tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {}),
               MalformedMessageError);
}

TEST(TransportClientTest, UndecodableReplyIsMalformed) {
  auto spTransport = std::make_shared<ScriptedTransport>(
      [](const std::vector<uint8_t>&) { return std::vector<uint8_t>{1, 2, 3}; });
  TransportClient tc(spTransport, nullptr);
  EXPECT_THROW(tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {}),
               MalformedMessageError);
}

TEST(TransportClientTest, ErrorRcodeIsServerRejected) {
  auto spTransport = std::make_shared<ScriptedTransport>(
      replyWith([](wire::Message& msg) { msg.iRcode = wire::kRcodeRefused; }));
  TransportClient tc(spTransport, nullptr);
  try {
    tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {});
    FAIL() << "expected ServerRejectedError";
  } catch (const ServerRejectedError& e) {
    EXPECT_EQ(e._iRcode, wire::kRcodeRefused);
    EXPECT_EQ(e._sRcodeName, "REFUSED");
    EXPECT_EQ(e._sErrorCode, "server_rejected");
  }
}

TEST(TransportClientTest, TransportErrorsPropagate) {
  auto spTransport = std::make_shared<ScriptedTransport>(
      [](const std::vector<uint8_t>&) -> std::vector<uint8_t> {
        throw NetworkError("connection refused");
      });
  TransportClient tc(spTransport, nullptr);
  EXPECT_THROW(tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {}),
               NetworkError);
}

TEST(TransportClientTest, AssignsFreshIds) {
  std::vector<uint16_t> vIds;
  auto spTransport = std::make_shared<ScriptedTransport>([&vIds](const std::vector<uint8_t>& v) {
    vIds.push_back(wire::peekId(v));
    return replyWith()(v);
  });
  TransportClient tc(spTransport, nullptr);
  for (int i = 0; i < 8; ++i) {
    tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {});
  }
  ASSERT_EQ(vIds.size(), 8u);
  // Eight random 16-bit IDs are all equal with negligible probability
  EXPECT_FALSE(std::all_of(vIds.begin(), vIds.end(), [&](uint16_t u) { return u == vIds[0]; }));
}

// ── TSIG ───────────────────────────────────────────────────────────────────

TEST(TransportClientTest, SignedExchangeVerifiesReply) {
  auto spSigner = std::make_shared<const TsigSigner>(makeTsig());
  auto spServer = std::make_shared<FakeNameserver>(spSigner);
  TransportClient tc(spServer, spSigner);

  EXPECT_NO_THROW(tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {}));
  ASSERT_EQ(spServer->requests().size(), 1u);
  EXPECT_NE(spServer->requests()[0].tsigRecord(), nullptr);
}

TEST(TransportClientTest, UnsignedReplyIsAuthenticationFailure) {
  auto spSigner = std::make_shared<const TsigSigner>(makeTsig());
  auto spServer = std::make_shared<FakeNameserver>();
  TransportClient tc(spServer, spSigner);

  try {
    tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {});
    FAIL() << "expected TsigError";
  } catch (const TsigError& e) {
    EXPECT_EQ(e._sErrorCode, "authentication_failure");
  }
}

TEST(TransportClientTest, WrongKeyIsRejectedByServer) {
  auto spClientSigner = std::make_shared<const TsigSigner>(makeTsig("d3Jvbmcta2V5"));
  auto spServerSigner = std::make_shared<const TsigSigner>(makeTsig());
  auto spServer = std::make_shared<FakeNameserver>(spServerSigner);
  TransportClient tc(spServer, spClientSigner);

  try {
    tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {});
    FAIL() << "expected ServerRejectedError";
  } catch (const ServerRejectedError& e) {
    EXPECT_EQ(e._sRcodeName, "NOTAUTH");
  }
}

TEST(TransportClientTest, TsigErrorFieldNamesTheRejection) {
  auto spTransport = std::make_shared<ScriptedTransport>(replyWith([](wire::Message& msg) {
    msg.iRcode = wire::kRcodeNotAuth;
    wire::ResourceRecord rr;
    rr.sName = "update-key.example.org.";
    rr.uType = wire::kTypeTsig;
    rr.uClass = wire::kClassAny;
    wire::TsigData td;
    td.sAlgorithm = "hmac-sha256.";
    td.uFudge = 300;
    td.uOriginalId = msg.uId;
    td.uError = wire::kRcodeBadTime;
    rr.rdData = td;
    msg.vAdditional.push_back(rr);
  }));
  TransportClient tc(spTransport, std::make_shared<const TsigSigner>(makeTsig()));

  try {
    tc.exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {});
    FAIL() << "expected ServerRejectedError";
  } catch (const ServerRejectedError& e) {
    EXPECT_EQ(e._iRcode, wire::kRcodeBadTime);
    EXPECT_EQ(e._sRcodeName, "BADTIME");
  }
}

// ── Coalescing ─────────────────────────────────────────────────────────────

class TransportClientCoalescingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sfGate = _prGate.get_future().share();
    _spTransport = std::make_shared<ScriptedTransport>([this](const std::vector<uint8_t>& v) {
      _sfGate.wait();
      return replyWith()(v);
    });
    _upClient = std::make_unique<TransportClient>(_spTransport, nullptr);
  }

  void TearDown() override {
    if (!_bReleased) _prGate.set_value();
  }

  void release() {
    _bReleased = true;
    _prGate.set_value();
  }

  void waitForCalls(int iCalls) {
    const auto tpDeadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (_spTransport->calls() < iCalls && std::chrono::steady_clock::now() < tpDeadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  std::promise<void> _prGate;
  std::shared_future<void> _sfGate;
  bool _bReleased = false;
  std::shared_ptr<ScriptedTransport> _spTransport;
  std::unique_ptr<TransportClient> _upClient;
};

TEST_F(TransportClientCoalescingTest, IdenticalRequestsShareOneExchange) {
  const auto msgQuery = ZoneQueryEngine::buildQuery("example.org.");

  auto fuLeader = std::async(std::launch::async,
                             [&] { return _upClient->exchange(msgQuery, kAddress, {}); });
  waitForCalls(1);
  auto fuFollower = std::async(std::launch::async,
                               [&] { return _upClient->exchange(msgQuery, kAddress, {}); });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  release();

  const auto msgLeader = fuLeader.get();
  const auto msgFollower = fuFollower.get();
  EXPECT_EQ(_spTransport->calls(), 1);
  EXPECT_EQ(msgLeader.uId, msgFollower.uId);
}

TEST_F(TransportClientCoalescingTest, DifferentRequestsAreNotShared) {
  auto fuFirst = std::async(std::launch::async, [&] {
    return _upClient->exchange(ZoneQueryEngine::buildQuery("example.org."), kAddress, {});
  });
  auto fuSecond = std::async(std::launch::async, [&] {
    return _upClient->exchange(ZoneQueryEngine::buildQuery("example.net."), kAddress, {});
  });
  waitForCalls(2);
  release();

  fuFirst.get();
  fuSecond.get();
  EXPECT_EQ(_spTransport->calls(), 2);
}

TEST_F(TransportClientCoalescingTest, FollowerCanBeCancelled) {
  const auto msgQuery = ZoneQueryEngine::buildQuery("example.org.");

  auto fuLeader = std::async(std::launch::async,
                             [&] { return _upClient->exchange(msgQuery, kAddress, {}); });
  waitForCalls(1);

  std::stop_source ssSource;
  auto fuFollower = std::async(std::launch::async, [&] {
    return _upClient->exchange(msgQuery, kAddress, ssSource.get_token());
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  ssSource.request_stop();

  EXPECT_THROW(fuFollower.get(), CancelledError);
  release();
  EXPECT_NO_THROW(fuLeader.get());
  EXPECT_EQ(_spTransport->calls(), 1);
}
