#include "core/RecordTranslator.hpp"

#include "common/Errors.hpp"
#include "wire/Name.hpp"
#include "wire/RecordType.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <limits>
#include <sstream>
#include <vector>

namespace rfc2136::core {

namespace {

constexpr std::size_t kMaxTextChunk = 255;

uint32_t clampTtl(std::chrono::seconds durTtl) {
  const auto iSeconds = durTtl.count();
  if (iSeconds <= 0) return 0;
  if (static_cast<uint64_t>(iSeconds) > std::numeric_limits<uint32_t>::max()) {
    return std::numeric_limits<uint32_t>::max();
  }
  return static_cast<uint32_t>(iSeconds);
}

uint16_t typeCode(SupportedType st) {
  switch (st) {
    case SupportedType::A: return wire::kTypeA;
    case SupportedType::Aaaa: return wire::kTypeAaaa;
    case SupportedType::Cname: return wire::kTypeCname;
    case SupportedType::Mx: return wire::kTypeMx;
    case SupportedType::Txt: return wire::kTypeTxt;
  }
  return 0;
}

std::vector<std::string> splitWhitespace(const std::string& sValue) {
  std::istringstream iss(sValue);
  std::vector<std::string> vTokens;
  std::string sToken;
  while (iss >> sToken) {
    vTokens.push_back(sToken);
  }
  return vTokens;
}

wire::MailExchange parseMx(const std::string& sValue) {
  const auto vTokens = splitWhitespace(sValue);
  wire::MailExchange mx;
  if (vTokens.size() == 1) {
    mx.sExchange = wire::fqdn(vTokens[0]);
    return mx;
  }
  if (vTokens.size() == 2) {
    const std::string& sPref = vTokens[0];
    uint16_t uPreference = 0;
    auto [pPtr, ec] = std::from_chars(sPref.data(), sPref.data() + sPref.size(), uPreference);
    if (ec == std::errc{} && pPtr == sPref.data() + sPref.size()) {
      mx.uPreference = uPreference;
      mx.sExchange = wire::fqdn(vTokens[1]);
      return mx;
    }
  }
  throw common::InvalidRecordValueError("MX value '" + sValue +
                                        "' is neither '<preference> <exchange>' nor '<exchange>'");
}

wire::TextChunks splitText(const std::string& sValue) {
  wire::TextChunks tc;
  if (sValue.empty()) {
    tc.vChunks.emplace_back();
    return tc;
  }
  for (std::size_t nPos = 0; nPos < sValue.size(); nPos += kMaxTextChunk) {
    tc.vChunks.push_back(sValue.substr(nPos, kMaxTextChunk));
  }
  return tc;
}

std::string renderOpaque(const std::vector<uint8_t>& vBytes) {
  // RFC3597 generic encoding
  std::string sOut = "\\# " + std::to_string(vBytes.size());
  if (!vBytes.empty()) {
    sOut.push_back(' ');
    char vHex[3];
    for (const auto b : vBytes) {
      std::snprintf(vHex, sizeof(vHex), "%02x", static_cast<unsigned>(b));
      sOut.append(vHex);
    }
  }
  return sOut;
}

}  // namespace

std::optional<SupportedType> RecordTranslator::parseType(const std::string& sType) {
  std::string sUpper = sType;
  std::transform(sUpper.begin(), sUpper.end(), sUpper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (sUpper == "A") return SupportedType::A;
  if (sUpper == "AAAA") return SupportedType::Aaaa;
  if (sUpper == "CNAME") return SupportedType::Cname;
  if (sUpper == "MX") return SupportedType::Mx;
  if (sUpper == "TXT") return SupportedType::Txt;
  return std::nullopt;
}

wire::ResourceRecord RecordTranslator::toWire(const std::string& sZone,
                                              const common::Record& rec) {
  const auto oType = parseType(rec.sType);
  if (!oType) {
    throw common::UnsupportedRecordTypeError(rec.sType);
  }

  wire::ResourceRecord rr;
  rr.sName = wire::fqdn(sZone);
  rr.uType = typeCode(*oType);
  rr.uClass = wire::kClassIn;
  rr.uTtl = clampTtl(rec.durTtl);

  switch (*oType) {
    case SupportedType::A: {
      wire::AddressV4 a4;
      if (inet_pton(AF_INET, rec.sValue.c_str(), a4.aBytes.data()) != 1) {
        throw common::InvalidRecordValueError("A value '" + rec.sValue +
                                              "' is not an IPv4 address");
      }
      rr.rdData = a4;
      break;
    }
    case SupportedType::Aaaa: {
      wire::AddressV6 a6;
      if (inet_pton(AF_INET6, rec.sValue.c_str(), a6.aBytes.data()) != 1) {
        throw common::InvalidRecordValueError("AAAA value '" + rec.sValue +
                                              "' is not an IPv6 address");
      }
      rr.rdData = a6;
      break;
    }
    case SupportedType::Cname:
      if (rec.sValue.empty()) {
        throw common::InvalidRecordValueError("CNAME value is empty");
      }
      rr.rdData = wire::DomainTarget{wire::fqdn(rec.sValue)};
      break;
    case SupportedType::Mx:
      rr.rdData = parseMx(rec.sValue);
      break;
    case SupportedType::Txt:
      rr.rdData = splitText(rec.sValue);
      break;
  }

  return rr;
}

std::string RecordTranslator::renderValue(const wire::ResourceRecord& rr) {
  if (const auto* pA4 = std::get_if<wire::AddressV4>(&rr.rdData)) {
    char vBuf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, pA4->aBytes.data(), vBuf, sizeof(vBuf));
    return vBuf;
  }
  if (const auto* pA6 = std::get_if<wire::AddressV6>(&rr.rdData)) {
    char vBuf[INET6_ADDRSTRLEN];
    inet_ntop(AF_INET6, pA6->aBytes.data(), vBuf, sizeof(vBuf));
    return vBuf;
  }
  if (const auto* pDt = std::get_if<wire::DomainTarget>(&rr.rdData)) {
    return pDt->sTarget;
  }
  if (const auto* pMx = std::get_if<wire::MailExchange>(&rr.rdData)) {
    return std::to_string(pMx->uPreference) + " " + pMx->sExchange;
  }
  if (const auto* pTc = std::get_if<wire::TextChunks>(&rr.rdData)) {
    std::string sOut;
    for (const auto& sChunk : pTc->vChunks) {
      sOut += sChunk;
    }
    return sOut;
  }
  if (const auto* pSoa = std::get_if<wire::StartOfAuthority>(&rr.rdData)) {
    std::ostringstream oss;
    oss << pSoa->sMname << ' ' << pSoa->sRname << ' ' << pSoa->uSerial << ' ' << pSoa->uRefresh
        << ' ' << pSoa->uRetry << ' ' << pSoa->uExpire << ' ' << pSoa->uMinimum;
    return oss.str();
  }
  if (const auto* pSrv = std::get_if<wire::ServiceLocation>(&rr.rdData)) {
    std::ostringstream oss;
    oss << pSrv->uPriority << ' ' << pSrv->uWeight << ' ' << pSrv->uPort << ' ' << pSrv->sTarget;
    return oss.str();
  }
  if (const auto* pTd = std::get_if<wire::TsigData>(&rr.rdData)) {
    return pTd->sAlgorithm + " " + std::to_string(pTd->uTimeSigned) + " " +
           std::to_string(pTd->uFudge);
  }
  return renderOpaque(std::get<wire::OpaqueData>(rr.rdData).vBytes);
}

common::Record RecordTranslator::fromWire(const wire::ResourceRecord& rr) {
  common::Record rec;
  rec.sName = rr.sName;
  rec.sType = wire::typeToString(rr.uType);
  rec.sValue = renderValue(rr);
  rec.durTtl = std::chrono::seconds(rr.uTtl);
  return rec;
}

}  // namespace rfc2136::core
