#include "core/RecordTranslator.hpp"

#include "common/Errors.hpp"
#include "wire/RecordType.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace rfc2136::common;
using rfc2136::core::RecordTranslator;
using rfc2136::core::SupportedType;
namespace wire = rfc2136::wire;

namespace {

Record makeRecord(const std::string& sType, const std::string& sValue, int64_t iTtl = 300) {
  return Record{"test.example.org.", sType, sValue, std::chrono::seconds(iTtl)};
}

}  // namespace

TEST(RecordTranslatorTest, ParseTypeIsCaseInsensitive) {
  EXPECT_EQ(RecordTranslator::parseType("a"), SupportedType::A);
  EXPECT_EQ(RecordTranslator::parseType("Aaaa"), SupportedType::Aaaa);
  EXPECT_EQ(RecordTranslator::parseType("TXT"), SupportedType::Txt);
  EXPECT_FALSE(RecordTranslator::parseType("SRV").has_value());
}

TEST(RecordTranslatorTest, OwnerNameIsTheZone) {
  const auto rr = RecordTranslator::toWire("example.org", makeRecord("A", "127.0.0.1"));
  EXPECT_EQ(rr.sName, "example.org.");
  EXPECT_EQ(rr.uType, wire::kTypeA);
  EXPECT_EQ(rr.uClass, wire::kClassIn);
  EXPECT_EQ(rr.uTtl, 300u);
  EXPECT_EQ(rr.rdData, wire::RData(wire::AddressV4{{127, 0, 0, 1}}));
}

TEST(RecordTranslatorTest, RoundTripsSupportedTypes) {
  struct Case {
    const char* pType;
    const char* pValue;
    const char* pExpected;
  };
  const Case vCases[] = {
      {"A", "127.0.0.1", "127.0.0.1"},
      {"AAAA", "2001:0db8:0000:0000:0000:0000:0000:0001", "2001:db8::1"},
      {"CNAME", "target.example.org", "target.example.org."},
      {"TXT", "v=spf1 -all", "v=spf1 -all"},
      {"MX", "10 mail.example.org", "10 mail.example.org."},
  };

  for (const auto& c : vCases) {
    SCOPED_TRACE(c.pType);
    const auto rr = RecordTranslator::toWire("example.org.", makeRecord(c.pType, c.pValue, 3600));
    const auto rec = RecordTranslator::fromWire(rr);
    EXPECT_EQ(rec.sName, "example.org.");
    EXPECT_EQ(rec.sType, c.pType);
    EXPECT_EQ(rec.sValue, c.pExpected);
    EXPECT_EQ(rec.durTtl, std::chrono::seconds(3600));
  }
}

TEST(RecordTranslatorTest, BareMxExchangeGetsPreferenceZero) {
  const auto rr = RecordTranslator::toWire("example.org.", makeRecord("MX", "mail.example.org."));
  EXPECT_EQ(rr.rdData, wire::RData(wire::MailExchange{0, "mail.example.org."}));
  EXPECT_EQ(RecordTranslator::renderValue(rr), "0 mail.example.org.");
}

TEST(RecordTranslatorTest, MalformedMxIsRejected) {
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("MX", "")),
               InvalidRecordValueError);
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("MX", "high mail.example.org")),
               InvalidRecordValueError);
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("MX", "70000 mail.example.org")),
               InvalidRecordValueError);
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("MX", "10 a b")),
               InvalidRecordValueError);
}

TEST(RecordTranslatorTest, LongTxtIsChunked) {
  const std::string sValue(600, 'x');
  const auto rr = RecordTranslator::toWire("example.org.", makeRecord("TXT", sValue));
  const auto& tc = std::get<wire::TextChunks>(rr.rdData);
  ASSERT_EQ(tc.vChunks.size(), 3u);
  EXPECT_EQ(tc.vChunks[0].size(), 255u);
  EXPECT_EQ(tc.vChunks[1].size(), 255u);
  EXPECT_EQ(tc.vChunks[2].size(), 90u);
  EXPECT_EQ(RecordTranslator::fromWire(rr).sValue, sValue);
}

TEST(RecordTranslatorTest, EmptyTxtIsOneEmptyChunk) {
  const auto rr = RecordTranslator::toWire("example.org.", makeRecord("TXT", ""));
  EXPECT_EQ(rr.rdData, wire::RData(wire::TextChunks{{""}}));
}

TEST(RecordTranslatorTest, UnsupportedTypeFails) {
  try {
    RecordTranslator::toWire("example.org.", makeRecord("SRV", "0 5 5060 sip.example.org."));
    FAIL() << "expected UnsupportedRecordTypeError";
  } catch (const UnsupportedRecordTypeError& e) {
    EXPECT_EQ(e._sType, "SRV");
    EXPECT_EQ(e._sErrorCode, "unsupported_record_type");
  }
}

TEST(RecordTranslatorTest, InvalidValuesFail) {
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("A", "not-an-ip")),
               InvalidRecordValueError);
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("A", "2001:db8::1")),
               InvalidRecordValueError);
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("AAAA", "192.0.2.1")),
               InvalidRecordValueError);
  EXPECT_THROW(RecordTranslator::toWire("example.org.", makeRecord("CNAME", "")),
               InvalidRecordValueError);
}

TEST(RecordTranslatorTest, TtlIsClamped) {
  EXPECT_EQ(RecordTranslator::toWire("example.org.", makeRecord("A", "192.0.2.1", -5)).uTtl, 0u);
  EXPECT_EQ(RecordTranslator::toWire("example.org.", makeRecord("A", "192.0.2.1", 1LL << 40)).uTtl,
            0xFFFFFFFFu);
}

TEST(RecordTranslatorTest, RendersReadOnlyTypes) {
  wire::ResourceRecord rrSoa;
  rrSoa.sName = "example.org.";
  rrSoa.uType = wire::kTypeSoa;
  rrSoa.uTtl = 3600;
  rrSoa.rdData = wire::StartOfAuthority{"ns1.example.org.", "hostmaster.example.org.", 2024010101,
                                        7200, 900, 1209600, 300};
  EXPECT_EQ(RecordTranslator::fromWire(rrSoa).sValue,
            "ns1.example.org. hostmaster.example.org. 2024010101 7200 900 1209600 300");
  EXPECT_EQ(RecordTranslator::fromWire(rrSoa).sType, "SOA");

  wire::ResourceRecord rrSrv;
  rrSrv.uType = wire::kTypeSrv;
  rrSrv.rdData = wire::ServiceLocation{0, 5, 5060, "sip.example.org."};
  EXPECT_EQ(RecordTranslator::renderValue(rrSrv), "0 5 5060 sip.example.org.");

  wire::ResourceRecord rrNs;
  rrNs.uType = wire::kTypeNs;
  rrNs.rdData = wire::DomainTarget{"ns1.example.org."};
  EXPECT_EQ(RecordTranslator::fromWire(rrNs).sType, "NS");
  EXPECT_EQ(RecordTranslator::fromWire(rrNs).sValue, "ns1.example.org.");
}

TEST(RecordTranslatorTest, UnknownTypesUseGenericEncoding) {
  wire::ResourceRecord rr;
  rr.sName = "example.org.";
  rr.uType = 65280;
  rr.rdData = wire::OpaqueData{{0x0A, 0xFF}};
  const auto rec = RecordTranslator::fromWire(rr);
  EXPECT_EQ(rec.sType, "TYPE65280");
  EXPECT_EQ(rec.sValue, "\\# 2 0aff");

  rr.rdData = wire::OpaqueData{};
  EXPECT_EQ(RecordTranslator::renderValue(rr), "\\# 0");
}
