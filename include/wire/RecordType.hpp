#pragma once

#include <cstdint>
#include <string>

namespace rfc2136::wire {

// ── Resource record types (RFC1035, RFC3596, RFC2782, RFC8945) ─────────────
inline constexpr uint16_t kTypeA = 1;
inline constexpr uint16_t kTypeNs = 2;
inline constexpr uint16_t kTypeCname = 5;
inline constexpr uint16_t kTypeSoa = 6;
inline constexpr uint16_t kTypePtr = 12;
inline constexpr uint16_t kTypeMx = 15;
inline constexpr uint16_t kTypeTxt = 16;
inline constexpr uint16_t kTypeAaaa = 28;
inline constexpr uint16_t kTypeSrv = 33;
inline constexpr uint16_t kTypeOpt = 41;
inline constexpr uint16_t kTypeTsig = 250;
inline constexpr uint16_t kTypeAny = 255;

// ── Classes; NONE and ANY carry delete semantics in UPDATE (RFC2136 §2.5) ──
inline constexpr uint16_t kClassIn = 1;
inline constexpr uint16_t kClassNone = 254;
inline constexpr uint16_t kClassAny = 255;

// ── Opcodes ────────────────────────────────────────────────────────────────
inline constexpr uint8_t kOpcodeQuery = 0;
inline constexpr uint8_t kOpcodeUpdate = 5;

// ── Response codes, including the TSIG extended errors ─────────────────────
inline constexpr int kRcodeNoError = 0;
inline constexpr int kRcodeFormErr = 1;
inline constexpr int kRcodeServFail = 2;
inline constexpr int kRcodeNxDomain = 3;
inline constexpr int kRcodeNotImp = 4;
inline constexpr int kRcodeRefused = 5;
inline constexpr int kRcodeYxDomain = 6;
inline constexpr int kRcodeYxRrset = 7;
inline constexpr int kRcodeNxRrset = 8;
inline constexpr int kRcodeNotAuth = 9;
inline constexpr int kRcodeNotZone = 10;
inline constexpr int kRcodeBadSig = 16;
inline constexpr int kRcodeBadKey = 17;
inline constexpr int kRcodeBadTime = 18;

/// Mnemonic for a type code; unknown codes render as "TYPE<n>" (RFC3597).
std::string typeToString(uint16_t uType);

/// Textual response code ("NOERROR", "REFUSED", "BADSIG", ...).
std::string rcodeToString(int iRcode);

}  // namespace rfc2136::wire
