#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <openssl/evp.h>

#include "common/Config.hpp"
#include "wire/Message.hpp"

namespace rfc2136::security {

/// TSIG (RFC8945) signing and verification with OpenSSL HMAC.
/// One static key per instance; no replay cache and no key rotation.
/// Class abbreviation: ts
class TsigSigner {
 public:
  /// Decodes the base64 secret and resolves the algorithm.
  /// Throws ValidationError on an inactive config, an undecodable secret or
  /// an unknown algorithm.
  explicit TsigSigner(const common::TsigConfig& tcConfig);
  ~TsigSigner();

  TsigSigner(const TsigSigner&) = delete;
  TsigSigner& operator=(const TsigSigner&) = delete;

  /// Appends a TSIG RR to an encoded message and bumps ARCOUNT.
  /// vRequestMac chains a reply to the request it answers; leave it empty
  /// when signing a request. Returns the MAC that was written.
  std::vector<uint8_t> sign(std::vector<uint8_t>& vMessage,
                            std::chrono::system_clock::time_point tpNow,
                            const std::vector<uint8_t>& vRequestMac = {}) const;

  /// Verifies the TSIG RR closing vMessage (msgDecoded is its decoded form).
  /// Throws TsigError on a missing, foreign, stale or wrong signature and
  /// ServerRejectedError when the peer reports a TSIG error (BADSIG, BADKEY,
  /// BADTIME).
  void verify(const std::vector<uint8_t>& vMessage, const wire::Message& msgDecoded,
              std::chrono::system_clock::time_point tpNow,
              const std::vector<uint8_t>& vRequestMac = {}) const;

  /// Fully qualified, lower-cased key name.
  const std::string& keyName() const { return _sKeyName; }

  /// Fully qualified, lower-cased algorithm name.
  const std::string& algorithm() const { return _sAlgorithm; }

  uint16_t fudge() const { return _uFudge; }

  /// Maps user spellings ("HMAC-SHA256", "hmac-md5") to the canonical
  /// algorithm name. Empty selects hmac-sha256. Unknown names are returned
  /// fully qualified and lower-cased, unchanged otherwise.
  static std::string normalizeAlgorithm(const std::string& sAlgorithm);

 private:
  std::vector<uint8_t> computeMac(const std::vector<uint8_t>& vUnsigned,
                                  const wire::TsigData& tdVariables,
                                  const std::vector<uint8_t>& vRequestMac) const;

  std::string _sKeyName;
  std::string _sAlgorithm;
  uint16_t _uFudge;
  std::vector<unsigned char> _vKey;  // raw decoded secret
  const EVP_MD* _pDigest;
};

}  // namespace rfc2136::security
