#include "wire/Message.hpp"

#include "common/Errors.hpp"
#include "wire/Name.hpp"
#include "wire/RecordType.hpp"

#include <algorithm>

namespace rfc2136::wire {

namespace {

// ── Writer ─────────────────────────────────────────────────────────────────

void appendU16(std::vector<uint8_t>& vOut, uint16_t uValue) {
  vOut.push_back(static_cast<uint8_t>(uValue >> 8));
  vOut.push_back(static_cast<uint8_t>(uValue & 0xFF));
}

void appendU32(std::vector<uint8_t>& vOut, uint32_t uValue) {
  appendU16(vOut, static_cast<uint16_t>(uValue >> 16));
  appendU16(vOut, static_cast<uint16_t>(uValue & 0xFFFF));
}

void appendCharacterString(std::vector<uint8_t>& vOut, const std::string& sChunk) {
  if (sChunk.size() > 255) {
    throw common::InvalidRecordValueError("character-string longer than 255 octets");
  }
  vOut.push_back(static_cast<uint8_t>(sChunk.size()));
  vOut.insert(vOut.end(), sChunk.begin(), sChunk.end());
}

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void appendRData(std::vector<uint8_t>& vOut, const RData& rdData) {
  std::visit(
      Overloaded{
          [&](const OpaqueData& od) { vOut.insert(vOut.end(), od.vBytes.begin(), od.vBytes.end()); },
          [&](const AddressV4& a4) { vOut.insert(vOut.end(), a4.aBytes.begin(), a4.aBytes.end()); },
          [&](const AddressV6& a6) { vOut.insert(vOut.end(), a6.aBytes.begin(), a6.aBytes.end()); },
          [&](const DomainTarget& dt) { appendName(vOut, dt.sTarget); },
          [&](const MailExchange& mx) {
            appendU16(vOut, mx.uPreference);
            appendName(vOut, mx.sExchange);
          },
          [&](const TextChunks& tc) {
            for (const auto& sChunk : tc.vChunks) {
              appendCharacterString(vOut, sChunk);
            }
          },
          [&](const StartOfAuthority& soa) {
            appendName(vOut, soa.sMname);
            appendName(vOut, soa.sRname);
            appendU32(vOut, soa.uSerial);
            appendU32(vOut, soa.uRefresh);
            appendU32(vOut, soa.uRetry);
            appendU32(vOut, soa.uExpire);
            appendU32(vOut, soa.uMinimum);
          },
          [&](const ServiceLocation& srv) {
            appendU16(vOut, srv.uPriority);
            appendU16(vOut, srv.uWeight);
            appendU16(vOut, srv.uPort);
            appendName(vOut, srv.sTarget);
          },
          [&](const TsigData& td) {
            appendName(vOut, canonicalName(td.sAlgorithm));
            appendU16(vOut, static_cast<uint16_t>((td.uTimeSigned >> 32) & 0xFFFF));
            appendU32(vOut, static_cast<uint32_t>(td.uTimeSigned & 0xFFFFFFFF));
            appendU16(vOut, td.uFudge);
            appendU16(vOut, static_cast<uint16_t>(td.vMac.size()));
            vOut.insert(vOut.end(), td.vMac.begin(), td.vMac.end());
            appendU16(vOut, td.uOriginalId);
            appendU16(vOut, td.uError);
            appendU16(vOut, static_cast<uint16_t>(td.vOther.size()));
            vOut.insert(vOut.end(), td.vOther.begin(), td.vOther.end());
          },
      },
      rdData);
}

// ── Reader ─────────────────────────────────────────────────────────────────

/// Bounds-checked cursor over an encoded message.
/// Class abbreviation: rd
class Reader {
 public:
  explicit Reader(const std::vector<uint8_t>& vData) : _vData(vData) {}

  std::size_t offset() const { return _nOffset; }

  void require(std::size_t nCount) const {
    if (_nOffset + nCount > _vData.size()) {
      throw common::MalformedMessageError("message truncated at offset " +
                                          std::to_string(_nOffset));
    }
  }

  uint8_t u8() {
    require(1);
    return _vData[_nOffset++];
  }

  uint16_t u16() {
    require(2);
    const auto uValue = static_cast<uint16_t>((_vData[_nOffset] << 8) | _vData[_nOffset + 1]);
    _nOffset += 2;
    return uValue;
  }

  uint32_t u32() {
    const uint32_t uHigh = u16();
    return (uHigh << 16) | u16();
  }

  std::vector<uint8_t> bytes(std::size_t nCount) {
    require(nCount);
    std::vector<uint8_t> vOut(_vData.begin() + static_cast<std::ptrdiff_t>(_nOffset),
                              _vData.begin() + static_cast<std::ptrdiff_t>(_nOffset + nCount));
    _nOffset += nCount;
    return vOut;
  }

  std::string name() { return readName(_vData.data(), _vData.size(), _nOffset); }

 private:
  const std::vector<uint8_t>& _vData;
  std::size_t _nOffset = 0;
};

RData readRData(Reader& rd, uint16_t uType, std::size_t nRdLength) {
  const std::size_t nEnd = rd.offset() + nRdLength;
  rd.require(nRdLength);

  // RRset deletions and empty prerequisites carry no RDATA
  if (nRdLength == 0) {
    return OpaqueData{};
  }

  RData rdData;
  switch (uType) {
    case kTypeA: {
      if (nRdLength != 4) throw common::MalformedMessageError("A record with bad length");
      AddressV4 a4;
      const auto vBytes = rd.bytes(4);
      std::copy(vBytes.begin(), vBytes.end(), a4.aBytes.begin());
      rdData = a4;
      break;
    }
    case kTypeAaaa: {
      if (nRdLength != 16) throw common::MalformedMessageError("AAAA record with bad length");
      AddressV6 a6;
      const auto vBytes = rd.bytes(16);
      std::copy(vBytes.begin(), vBytes.end(), a6.aBytes.begin());
      rdData = a6;
      break;
    }
    case kTypeNs:
    case kTypeCname:
    case kTypePtr:
      rdData = DomainTarget{rd.name()};
      break;
    case kTypeMx: {
      MailExchange mx;
      mx.uPreference = rd.u16();
      mx.sExchange = rd.name();
      rdData = mx;
      break;
    }
    case kTypeTxt: {
      TextChunks tc;
      while (rd.offset() < nEnd) {
        const uint8_t uLength = rd.u8();
        const auto vChunk = rd.bytes(uLength);
        tc.vChunks.emplace_back(vChunk.begin(), vChunk.end());
      }
      rdData = tc;
      break;
    }
    case kTypeSoa: {
      StartOfAuthority soa;
      soa.sMname = rd.name();
      soa.sRname = rd.name();
      soa.uSerial = rd.u32();
      soa.uRefresh = rd.u32();
      soa.uRetry = rd.u32();
      soa.uExpire = rd.u32();
      soa.uMinimum = rd.u32();
      rdData = soa;
      break;
    }
    case kTypeSrv: {
      ServiceLocation srv;
      srv.uPriority = rd.u16();
      srv.uWeight = rd.u16();
      srv.uPort = rd.u16();
      srv.sTarget = rd.name();
      rdData = srv;
      break;
    }
    case kTypeTsig: {
      TsigData td;
      td.sAlgorithm = rd.name();
      const uint64_t uHigh = rd.u16();
      td.uTimeSigned = (uHigh << 32) | rd.u32();
      td.uFudge = rd.u16();
      td.vMac = rd.bytes(rd.u16());
      td.uOriginalId = rd.u16();
      td.uError = rd.u16();
      td.vOther = rd.bytes(rd.u16());
      rdData = td;
      break;
    }
    default:
      rdData = OpaqueData{rd.bytes(nRdLength)};
      break;
  }

  if (rd.offset() != nEnd) {
    throw common::MalformedMessageError(typeToString(uType) + " RDATA length mismatch");
  }
  return rdData;
}

ResourceRecord readRecord(Reader& rd) {
  ResourceRecord rr;
  rr.sName = rd.name();
  rr.uType = rd.u16();
  rr.uClass = rd.u16();
  rr.uTtl = rd.u32();
  const uint16_t uRdLength = rd.u16();
  rr.rdData = readRData(rd, rr.uType, uRdLength);
  return rr;
}

}  // namespace

void appendRecord(std::vector<uint8_t>& vOut, const ResourceRecord& rr) {
  appendName(vOut, rr.sName);
  appendU16(vOut, rr.uType);
  appendU16(vOut, rr.uClass);
  appendU32(vOut, rr.uTtl);

  const std::size_t nLengthPos = vOut.size();
  appendU16(vOut, 0);
  appendRData(vOut, rr.rdData);

  const std::size_t nRdLength = vOut.size() - nLengthPos - 2;
  if (nRdLength > 0xFFFF) {
    throw common::InvalidRecordValueError("RDATA longer than 65535 octets");
  }
  vOut[nLengthPos] = static_cast<uint8_t>(nRdLength >> 8);
  vOut[nLengthPos + 1] = static_cast<uint8_t>(nRdLength & 0xFF);
}

// ── Message ────────────────────────────────────────────────────────────────

std::vector<uint8_t> Message::encode() const {
  std::vector<uint8_t> vOut;
  vOut.reserve(512);

  uint16_t uFlags = 0;
  if (bResponse) uFlags |= 0x8000;
  uFlags |= static_cast<uint16_t>((uOpcode & 0x0F) << 11);
  if (bAuthoritative) uFlags |= 0x0400;
  if (bTruncated) uFlags |= 0x0200;
  if (bRecursionDesired) uFlags |= 0x0100;
  if (bRecursionAvailable) uFlags |= 0x0080;
  uFlags |= static_cast<uint16_t>(iRcode & 0x0F);

  appendU16(vOut, uId);
  appendU16(vOut, uFlags);
  appendU16(vOut, static_cast<uint16_t>(vQuestions.size()));
  appendU16(vOut, static_cast<uint16_t>(vAnswers.size()));
  appendU16(vOut, static_cast<uint16_t>(vAuthority.size()));
  appendU16(vOut, static_cast<uint16_t>(vAdditional.size()));

  for (const auto& q : vQuestions) {
    appendName(vOut, q.sName);
    appendU16(vOut, q.uType);
    appendU16(vOut, q.uClass);
  }
  for (const auto& rr : vAnswers) appendRecord(vOut, rr);
  for (const auto& rr : vAuthority) appendRecord(vOut, rr);
  for (const auto& rr : vAdditional) appendRecord(vOut, rr);

  return vOut;
}

Message Message::decode(const std::vector<uint8_t>& vData) {
  if (vData.size() < kHeaderSize) {
    throw common::MalformedMessageError("message shorter than the 12-octet header (" +
                                        std::to_string(vData.size()) + " octets)");
  }

  Reader rd(vData);
  Message msg;
  msg.uId = rd.u16();
  const uint16_t uFlags = rd.u16();
  msg.bResponse = (uFlags & 0x8000) != 0;
  msg.uOpcode = static_cast<uint8_t>((uFlags >> 11) & 0x0F);
  msg.bAuthoritative = (uFlags & 0x0400) != 0;
  msg.bTruncated = (uFlags & 0x0200) != 0;
  msg.bRecursionDesired = (uFlags & 0x0100) != 0;
  msg.bRecursionAvailable = (uFlags & 0x0080) != 0;
  msg.iRcode = uFlags & 0x000F;

  const uint16_t uQdCount = rd.u16();
  const uint16_t uAnCount = rd.u16();
  const uint16_t uNsCount = rd.u16();
  const uint16_t uArCount = rd.u16();

  for (uint16_t i = 0; i < uQdCount; ++i) {
    Question q;
    q.sName = rd.name();
    q.uType = rd.u16();
    q.uClass = rd.u16();
    msg.vQuestions.push_back(std::move(q));
  }
  for (uint16_t i = 0; i < uAnCount; ++i) msg.vAnswers.push_back(readRecord(rd));
  for (uint16_t i = 0; i < uNsCount; ++i) msg.vAuthority.push_back(readRecord(rd));

  std::size_t nLastOffset = 0;
  for (uint16_t i = 0; i < uArCount; ++i) {
    nLastOffset = rd.offset();
    msg.vAdditional.push_back(readRecord(rd));
  }
  if (!msg.vAdditional.empty() && msg.vAdditional.back().uType == kTypeTsig) {
    if (!std::holds_alternative<TsigData>(msg.vAdditional.back().rdData)) {
      throw common::MalformedMessageError("TSIG record without RDATA");
    }
    msg.nTsigOffset = nLastOffset;
  }

  if (rd.offset() != vData.size()) {
    throw common::MalformedMessageError("trailing octets after final record");
  }
  return msg;
}

const ResourceRecord* Message::tsigRecord() const {
  if (nTsigOffset == 0 || vAdditional.empty()) return nullptr;
  return &vAdditional.back();
}

uint16_t peekId(const std::vector<uint8_t>& vData) {
  if (vData.size() < 2) {
    throw common::MalformedMessageError("message too short to carry an ID");
  }
  return static_cast<uint16_t>((vData[0] << 8) | vData[1]);
}

void pokeId(std::vector<uint8_t>& vData, uint16_t uId) {
  if (vData.size() < 2) {
    throw common::MalformedMessageError("message too short to carry an ID");
  }
  vData[0] = static_cast<uint8_t>(uId >> 8);
  vData[1] = static_cast<uint8_t>(uId & 0xFF);
}

}  // namespace rfc2136::wire
