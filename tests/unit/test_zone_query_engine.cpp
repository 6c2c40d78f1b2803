#include "core/ZoneQueryEngine.hpp"

#include "common/Errors.hpp"
#include "support/FakeNameserver.hpp"
#include "wire/RecordType.hpp"

#include <gtest/gtest.h>

#include <memory>

using rfc2136::core::ZoneQueryEngine;
using rfc2136::test_support::FakeNameserver;
using rfc2136::transport::TransportClient;
namespace wire = rfc2136::wire;

TEST(ZoneQueryEngineTest, BuildsAnyQueryWithRecursionDesired) {
  const auto msg = ZoneQueryEngine::buildQuery("example.org");
  EXPECT_EQ(msg.uOpcode, wire::kOpcodeQuery);
  EXPECT_TRUE(msg.bRecursionDesired);
  ASSERT_EQ(msg.vQuestions.size(), 1u);
  EXPECT_EQ(msg.vQuestions[0].sName, "example.org.");
  EXPECT_EQ(msg.vQuestions[0].uType, wire::kTypeAny);
  EXPECT_EQ(msg.vQuestions[0].uClass, wire::kClassIn);
}

TEST(ZoneQueryEngineTest, ReturnsAnswersInServerOrder) {
  auto spServer = std::make_shared<FakeNameserver>();

  wire::ResourceRecord rrSoa;
  rrSoa.sName = "example.org.";
  rrSoa.uType = wire::kTypeSoa;
  rrSoa.uClass = wire::kClassIn;
  rrSoa.uTtl = 3600;
  rrSoa.rdData = wire::StartOfAuthority{"ns1.example.org.", "hostmaster.example.org.", 1, 2, 3,
                                        4, 5};
  spServer->seed(rrSoa);

  wire::ResourceRecord rrTxt;
  rrTxt.sName = "example.org.";
  rrTxt.uType = wire::kTypeTxt;
  rrTxt.uClass = wire::kClassIn;
  rrTxt.uTtl = 300;
  rrTxt.rdData = wire::TextChunks{{"v1"}};
  spServer->seed(rrTxt);
  spServer->seed(rrTxt);

  TransportClient tcClient(spServer, nullptr);
  ZoneQueryEngine zqe(tcClient);
  const auto vRecords = zqe.query("example.org", "192.0.2.53:53", std::stop_token{});

  ASSERT_EQ(vRecords.size(), 3u);
  EXPECT_EQ(vRecords[0].sType, "SOA");
  EXPECT_EQ(vRecords[0].sValue, "ns1.example.org. hostmaster.example.org. 1 2 3 4 5");
  EXPECT_EQ(vRecords[1].sType, "TXT");
  EXPECT_EQ(vRecords[1].sValue, "v1");
  EXPECT_EQ(vRecords[1].durTtl, std::chrono::seconds(300));
  // No deduplication
  EXPECT_EQ(vRecords[2], vRecords[1]);
}

TEST(ZoneQueryEngineTest, EmptyZoneGivesEmptyList) {
  auto spServer = std::make_shared<FakeNameserver>();
  TransportClient tcClient(spServer, nullptr);
  ZoneQueryEngine zqe(tcClient);
  EXPECT_TRUE(zqe.query("example.org.", "192.0.2.53:53", std::stop_token{}).empty());
}
