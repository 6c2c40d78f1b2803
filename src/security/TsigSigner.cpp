#include "security/TsigSigner.hpp"

#include "common/Errors.hpp"
#include "wire/Name.hpp"
#include "wire/RecordType.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <stdexcept>
#include <variant>

namespace rfc2136::security {

namespace {

constexpr std::size_t kArCountOffset = 10;

struct AlgorithmEntry {
  const char* pName;
  const char* pAlias;
  const EVP_MD* (*fnDigest)();
};

const std::array<AlgorithmEntry, 6> kAlgorithms{{
    {"hmac-md5.sig-alg.reg.int.", "hmac-md5.", &EVP_md5},
    {"hmac-sha1.", nullptr, &EVP_sha1},
    {"hmac-sha224.", nullptr, &EVP_sha224},
    {"hmac-sha256.", nullptr, &EVP_sha256},
    {"hmac-sha384.", nullptr, &EVP_sha384},
    {"hmac-sha512.", nullptr, &EVP_sha512},
}};

// ── Base64 decode ──────────────────────────────────────────────────────────

std::vector<unsigned char> base64Decode(const std::string& sEncoded) {
  EVP_ENCODE_CTX* pCtx = EVP_ENCODE_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create EVP_ENCODE_CTX");
  }

  EVP_DecodeInit(pCtx);

  std::vector<unsigned char> vOut(sEncoded.size() + 3);
  int iOutLen = 0;
  int iTotalLen = 0;

  int iRet = EVP_DecodeUpdate(pCtx, vOut.data(), &iOutLen,
                              reinterpret_cast<const unsigned char*>(sEncoded.data()),
                              static_cast<int>(sEncoded.size()));
  if (iRet < 0) {
    EVP_ENCODE_CTX_free(pCtx);
    throw common::ValidationError("TSIG secret is not valid base64");
  }
  iTotalLen += iOutLen;

  iRet = EVP_DecodeFinal(pCtx, vOut.data() + iTotalLen, &iOutLen);
  EVP_ENCODE_CTX_free(pCtx);
  if (iRet < 0) {
    throw common::ValidationError("TSIG secret is not valid base64");
  }
  iTotalLen += iOutLen;

  vOut.resize(static_cast<size_t>(iTotalLen));
  return vOut;
}

void appendU16(std::vector<uint8_t>& vOut, uint16_t uValue) {
  vOut.push_back(static_cast<uint8_t>(uValue >> 8));
  vOut.push_back(static_cast<uint8_t>(uValue & 0xFF));
}

void appendU32(std::vector<uint8_t>& vOut, uint32_t uValue) {
  appendU16(vOut, static_cast<uint16_t>(uValue >> 16));
  appendU16(vOut, static_cast<uint16_t>(uValue & 0xFFFF));
}

uint16_t readU16(const std::vector<uint8_t>& vData, std::size_t nOffset) {
  return static_cast<uint16_t>((vData[nOffset] << 8) | vData[nOffset + 1]);
}

void writeU16(std::vector<uint8_t>& vData, std::size_t nOffset, uint16_t uValue) {
  vData[nOffset] = static_cast<uint8_t>(uValue >> 8);
  vData[nOffset + 1] = static_cast<uint8_t>(uValue & 0xFF);
}

uint64_t toUnixSeconds(std::chrono::system_clock::time_point tp) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

}  // anonymous namespace

// ── TsigSigner ─────────────────────────────────────────────────────────────

std::string TsigSigner::normalizeAlgorithm(const std::string& sAlgorithm) {
  if (sAlgorithm.empty()) {
    return "hmac-sha256.";
  }
  const std::string sCanonical = wire::canonicalName(sAlgorithm);
  for (const auto& ae : kAlgorithms) {
    if (sCanonical == ae.pName || (ae.pAlias && sCanonical == ae.pAlias)) {
      return ae.pName;
    }
  }
  return sCanonical;
}

TsigSigner::TsigSigner(const common::TsigConfig& tcConfig)
    : _sKeyName(wire::canonicalName(tcConfig.sKeyName)),
      _sAlgorithm(normalizeAlgorithm(tcConfig.sAlgorithm)),
      _uFudge(tcConfig.uFudgeSeconds),
      _pDigest(nullptr) {
  if (!tcConfig.active()) {
    throw common::ValidationError("TSIG requires both a key name and a secret");
  }

  for (const auto& ae : kAlgorithms) {
    if (_sAlgorithm == ae.pName) {
      _pDigest = ae.fnDigest();
      break;
    }
  }
  if (_pDigest == nullptr) {
    throw common::ValidationError("Unsupported TSIG algorithm: " + tcConfig.sAlgorithm);
  }

  _vKey = base64Decode(tcConfig.sSecret);
  if (_vKey.empty()) {
    throw common::ValidationError("TSIG secret decodes to an empty key");
  }
}

TsigSigner::~TsigSigner() {
  // Zero the key from memory
  if (!_vKey.empty()) {
    OPENSSL_cleanse(_vKey.data(), _vKey.size());
  }
}

std::vector<uint8_t> TsigSigner::computeMac(const std::vector<uint8_t>& vUnsigned,
                                            const wire::TsigData& tdVariables,
                                            const std::vector<uint8_t>& vRequestMac) const {
  // RFC8945 §4.3.3: request MAC (for replies), message, TSIG variables
  std::vector<uint8_t> vDigestInput;
  vDigestInput.reserve(vUnsigned.size() + vRequestMac.size() + 128);
  if (!vRequestMac.empty()) {
    appendU16(vDigestInput, static_cast<uint16_t>(vRequestMac.size()));
    vDigestInput.insert(vDigestInput.end(), vRequestMac.begin(), vRequestMac.end());
  }
  vDigestInput.insert(vDigestInput.end(), vUnsigned.begin(), vUnsigned.end());

  wire::appendName(vDigestInput, _sKeyName);
  appendU16(vDigestInput, wire::kClassAny);
  appendU32(vDigestInput, 0);
  wire::appendName(vDigestInput, _sAlgorithm);
  appendU16(vDigestInput, static_cast<uint16_t>((tdVariables.uTimeSigned >> 32) & 0xFFFF));
  appendU32(vDigestInput, static_cast<uint32_t>(tdVariables.uTimeSigned & 0xFFFFFFFF));
  appendU16(vDigestInput, tdVariables.uFudge);
  appendU16(vDigestInput, tdVariables.uError);
  appendU16(vDigestInput, static_cast<uint16_t>(tdVariables.vOther.size()));
  vDigestInput.insert(vDigestInput.end(), tdVariables.vOther.begin(), tdVariables.vOther.end());

  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  unsigned char* pResult = HMAC(
      _pDigest,
      _vKey.data(), static_cast<int>(_vKey.size()),
      vDigestInput.data(), vDigestInput.size(),
      vHash, &uHashLen);

  if (!pResult) {
    throw std::runtime_error("HMAC computation failed for " + _sAlgorithm);
  }

  return std::vector<uint8_t>(vHash, vHash + uHashLen);
}

std::vector<uint8_t> TsigSigner::sign(std::vector<uint8_t>& vMessage,
                                      std::chrono::system_clock::time_point tpNow,
                                      const std::vector<uint8_t>& vRequestMac) const {
  if (vMessage.size() < wire::kHeaderSize) {
    throw common::MalformedMessageError("cannot sign a message without a header");
  }

  wire::TsigData td;
  td.sAlgorithm = _sAlgorithm;
  td.uTimeSigned = toUnixSeconds(tpNow);
  td.uFudge = _uFudge;
  td.uOriginalId = wire::peekId(vMessage);
  td.vMac = computeMac(vMessage, td, vRequestMac);

  wire::ResourceRecord rr;
  rr.sName = _sKeyName;
  rr.uType = wire::kTypeTsig;
  rr.uClass = wire::kClassAny;
  rr.uTtl = 0;
  rr.rdData = td;
  wire::appendRecord(vMessage, rr);

  writeU16(vMessage, kArCountOffset, static_cast<uint16_t>(readU16(vMessage, kArCountOffset) + 1));
  return td.vMac;
}

void TsigSigner::verify(const std::vector<uint8_t>& vMessage, const wire::Message& msgDecoded,
                        std::chrono::system_clock::time_point tpNow,
                        const std::vector<uint8_t>& vRequestMac) const {
  const wire::ResourceRecord* pRecord = msgDecoded.tsigRecord();
  if (pRecord == nullptr) {
    throw common::TsigError("message is not TSIG-signed");
  }
  const auto& td = std::get<wire::TsigData>(pRecord->rdData);

  if (!wire::equalNames(pRecord->sName, _sKeyName)) {
    throw common::TsigError("message signed with unexpected key " + pRecord->sName);
  }
  if (normalizeAlgorithm(td.sAlgorithm) != _sAlgorithm) {
    throw common::TsigError("message signed with unexpected algorithm " + td.sAlgorithm);
  }
  if (td.uError != 0) {
    const std::string sError = wire::rcodeToString(td.uError);
    throw common::ServerRejectedError(td.uError, sError, "peer reported TSIG error " + sError);
  }

  // Strip the TSIG RR and restore the header the signer saw
  std::vector<uint8_t> vUnsigned(vMessage.begin(),
                                 vMessage.begin() + static_cast<std::ptrdiff_t>(msgDecoded.nTsigOffset));
  wire::pokeId(vUnsigned, td.uOriginalId);
  writeU16(vUnsigned, kArCountOffset,
           static_cast<uint16_t>(readU16(vUnsigned, kArCountOffset) - 1));

  const std::vector<uint8_t> vExpected = computeMac(vUnsigned, td, vRequestMac);

  // Constant-time comparison to prevent timing attacks
  if (vExpected.size() != td.vMac.size() ||
      CRYPTO_memcmp(vExpected.data(), td.vMac.data(), vExpected.size()) != 0) {
    throw common::TsigError("TSIG signature verification failed");
  }

  const uint64_t uNow = toUnixSeconds(tpNow);
  const uint64_t uSkew = uNow > td.uTimeSigned ? uNow - td.uTimeSigned : td.uTimeSigned - uNow;
  if (uSkew > td.uFudge) {
    throw common::TsigError("TSIG time signed is outside the fudge window (skew " +
                            std::to_string(uSkew) + "s)");
  }
}

}  // namespace rfc2136::security
