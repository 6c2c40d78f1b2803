#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <openssl/crypto.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace rfc2136::common {

// ── ProviderConfig JSON ────────────────────────────────────────────────────

ProviderConfig ProviderConfig::fromJson(const nlohmann::json& jConfig) {
  if (!jConfig.is_object()) {
    throw ValidationError("provider configuration must be a JSON object");
  }

  ProviderConfig pc;
  try {
    pc.sNameserver = jConfig.value("nameserver", std::string{});

    TsigConfig tc;
    tc.sAlgorithm = jConfig.value("tsig_algorithm", std::string{});
    tc.sKeyName = jConfig.value("tsig_keyname", std::string{});
    tc.sSecret = jConfig.value("tsig_secret", std::string{});
    if (!tc.sKeyName.empty() || !tc.sSecret.empty() || !tc.sAlgorithm.empty()) {
      pc.oTsig = tc;
    }

    if (jConfig.contains("transport")) {
      pc.tkTransport = Config::parseTransport(jConfig.at("transport").get<std::string>());
    }
    if (jConfig.contains("timeout_ms")) {
      const auto iTimeoutMs = jConfig.at("timeout_ms").get<int64_t>();
      if (iTimeoutMs <= 0 || iTimeoutMs > ProviderConfig::kMaxTimeout.count()) {
        throw ValidationError("timeout_ms must be between 1 and " +
                              std::to_string(ProviderConfig::kMaxTimeout.count()) + " (got " +
                              std::to_string(iTimeoutMs) + ")");
      }
      pc.durTimeout = std::chrono::milliseconds(iTimeoutMs);
    }
  } catch (const nlohmann::json::exception& ex) {
    throw ValidationError(std::string("invalid provider configuration: ") + ex.what());
  }

  if (pc.sNameserver.empty()) {
    throw ValidationError("provider configuration is missing 'nameserver'");
  }
  return pc;
}

nlohmann::json ProviderConfig::toJson() const {
  nlohmann::json jConfig = {
      {"nameserver", sNameserver},
      {"transport", Config::transportName(tkTransport)},
      {"timeout_ms", durTimeout.count()}};
  if (oTsig) {
    jConfig["tsig_algorithm"] = oTsig->sAlgorithm;
    jConfig["tsig_keyname"] = oTsig->sKeyName;
    jConfig["tsig_secret"] = oTsig->sSecret;
  }
  return jConfig;
}

// ── Environment ────────────────────────────────────────────────────────────

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  int iValue = 0;
  const char* pEnd = sValue.data() + sValue.size();
  auto [pPtr, ec] = std::from_chars(sValue.data(), pEnd, iValue);
  if (ec != std::errc{} || pPtr != pEnd) {
    throw ValidationError(std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

std::string Config::loadSecret(const char* pVarName) {
  // Try the direct env var first
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return {};
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ValidationError("Cannot open secret file specified by " + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ValidationError("Secret file is empty: " + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

TransportKind Config::parseTransport(const std::string& sValue) {
  if (sValue == "udp") return TransportKind::Udp;
  if (sValue == "tcp") return TransportKind::Tcp;
  throw ValidationError("Unsupported transport '" + sValue + "' (expected udp or tcp)");
}

std::string Config::transportName(TransportKind tkTransport) {
  return tkTransport == TransportKind::Tcp ? "tcp" : "udp";
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.pcProvider.sNameserver = getEnv("RFC2136_NAMESERVER");
  if (cfg.pcProvider.sNameserver.empty()) {
    throw ValidationError("Required environment variable RFC2136_NAMESERVER is not set");
  }

  // ── TSIG ───────────────────────────────────────────────────────────────
  TsigConfig tc;
  tc.sKeyName = getEnv("RFC2136_TSIG_KEYNAME");
  tc.sAlgorithm = getEnv("RFC2136_TSIG_ALGORITHM");
  tc.sSecret = loadSecret("RFC2136_TSIG_SECRET");

  if (tc.sKeyName.empty() != tc.sSecret.empty()) {
    const bool bHasKeyName = !tc.sKeyName.empty();
    OPENSSL_cleanse(tc.sSecret.data(), tc.sSecret.size());
    throw ValidationError(bHasKeyName
                              ? "RFC2136_TSIG_KEYNAME is set but RFC2136_TSIG_SECRET is not"
                              : "RFC2136_TSIG_SECRET is set but RFC2136_TSIG_KEYNAME is not");
  }
  if (tc.active()) {
    cfg.pcProvider.oTsig = tc;
  }
  // The copy inside pcProvider is the only one that should survive
  OPENSSL_cleanse(tc.sSecret.data(), tc.sSecret.size());

  // ── Optional vars with defaults ────────────────────────────────────────
  const std::string sTransport = getEnv("RFC2136_TRANSPORT");
  if (!sTransport.empty()) {
    cfg.pcProvider.tkTransport = parseTransport(sTransport);
  }

  const int iTimeoutMs = getEnvInt("RFC2136_TIMEOUT_MS", 2000);
  if (iTimeoutMs <= 0) {
    throw ValidationError("RFC2136_TIMEOUT_MS must be > 0 (got " + std::to_string(iTimeoutMs) +
                          ")");
  }
  cfg.pcProvider.durTimeout = std::chrono::milliseconds(iTimeoutMs);

  const std::string sLogLevel = getEnv("RFC2136_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  return cfg;
}

}  // namespace rfc2136::common
