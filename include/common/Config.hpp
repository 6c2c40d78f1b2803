#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace rfc2136::common {

/// TSIG key material, immutable once handed to a provider.
/// Class abbreviation: tc
struct TsigConfig {
  std::string sKeyName;
  std::string sAlgorithm;  // empty selects hmac-sha256
  std::string sSecret;     // base64
  uint16_t uFudgeSeconds = 300;

  /// Signing is enabled only when both key name and secret are present.
  bool active() const { return !sKeyName.empty() && !sSecret.empty(); }
};

/// Everything a provider needs, set once at construction.
/// Class abbreviation: pc
struct ProviderConfig {
  std::string sNameserver;
  std::optional<TsigConfig> oTsig;
  TransportKind tkTransport = TransportKind::Udp;
  std::chrono::milliseconds durTimeout{2000};

  /// Upper bound on durTimeout, the range RFC2136_TIMEOUT_MS can express.
  static constexpr std::chrono::milliseconds kMaxTimeout{std::numeric_limits<int>::max()};

  /// Keys: nameserver, tsig_algorithm, tsig_keyname, tsig_secret,
  /// transport, timeout_ms. Missing optional keys keep their defaults.
  static ProviderConfig fromJson(const nlohmann::json& jConfig);
  nlohmann::json toJson() const;
};

/// Environment variable loader for the command-line front end.
/// Class abbreviation: cfg
struct Config {
  ProviderConfig pcProvider;
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for RFC2136_TSIG_SECRET.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

  /// Parse a transport name ("udp" or "tcp"); throws ValidationError otherwise.
  static TransportKind parseTransport(const std::string& sValue);

  /// Inverse of parseTransport.
  static std::string transportName(TransportKind tkTransport);

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// Returns empty when neither the var nor its _FILE variant is set.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace rfc2136::common
