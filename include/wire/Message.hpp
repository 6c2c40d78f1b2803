#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rfc2136::wire {

inline constexpr std::size_t kHeaderSize = 12;

// ── RDATA payloads ─────────────────────────────────────────────────────────

/// Raw bytes; also the empty RDATA of RRset-deletion directives.
struct OpaqueData {
  std::vector<uint8_t> vBytes;
  bool operator==(const OpaqueData&) const = default;
};

struct AddressV4 {
  std::array<uint8_t, 4> aBytes{};
  bool operator==(const AddressV4&) const = default;
};

struct AddressV6 {
  std::array<uint8_t, 16> aBytes{};
  bool operator==(const AddressV6&) const = default;
};

/// Single domain name payload: CNAME, NS, PTR.
struct DomainTarget {
  std::string sTarget;
  bool operator==(const DomainTarget&) const = default;
};

struct MailExchange {
  uint16_t uPreference = 0;
  std::string sExchange;
  bool operator==(const MailExchange&) const = default;
};

/// TXT character-strings, each at most 255 octets.
struct TextChunks {
  std::vector<std::string> vChunks;
  bool operator==(const TextChunks&) const = default;
};

struct StartOfAuthority {
  std::string sMname;
  std::string sRname;
  uint32_t uSerial = 0;
  uint32_t uRefresh = 0;
  uint32_t uRetry = 0;
  uint32_t uExpire = 0;
  uint32_t uMinimum = 0;
  bool operator==(const StartOfAuthority&) const = default;
};

struct ServiceLocation {
  uint16_t uPriority = 0;
  uint16_t uWeight = 0;
  uint16_t uPort = 0;
  std::string sTarget;
  bool operator==(const ServiceLocation&) const = default;
};

/// TSIG RDATA (RFC8945 §4.2). Time signed is a 48-bit value.
struct TsigData {
  std::string sAlgorithm;
  uint64_t uTimeSigned = 0;
  uint16_t uFudge = 0;
  std::vector<uint8_t> vMac;
  uint16_t uOriginalId = 0;
  uint16_t uError = 0;
  std::vector<uint8_t> vOther;
  bool operator==(const TsigData&) const = default;
};

using RData = std::variant<OpaqueData, AddressV4, AddressV6, DomainTarget, MailExchange,
                           TextChunks, StartOfAuthority, ServiceLocation, TsigData>;

// ── Sections ───────────────────────────────────────────────────────────────

/// Question entry; the zone section of an UPDATE uses the same layout.
/// Class abbreviation: q
struct Question {
  std::string sName;
  uint16_t uType = 0;
  uint16_t uClass = 0;
};

/// Wire resource record.
/// Class abbreviation: rr
struct ResourceRecord {
  std::string sName;
  uint16_t uType = 0;
  uint16_t uClass = 0;
  uint32_t uTtl = 0;
  RData rdData;
};

/// DNS message (RFC1035 §4). For UPDATE (RFC2136 §2) the sections are
/// reinterpreted: questions hold the zone, answers the prerequisites and
/// authority the updates.
/// Class abbreviation: msg
struct Message {
  uint16_t uId = 0;
  bool bResponse = false;
  uint8_t uOpcode = 0;
  bool bAuthoritative = false;
  bool bTruncated = false;
  bool bRecursionDesired = false;
  bool bRecursionAvailable = false;
  int iRcode = 0;

  std::vector<Question> vQuestions;
  std::vector<ResourceRecord> vAnswers;
  std::vector<ResourceRecord> vAuthority;
  std::vector<ResourceRecord> vAdditional;

  /// Set by decode(): offset of the final additional record when it is a
  /// TSIG RR, zero otherwise.
  std::size_t nTsigOffset = 0;

  /// Serialize without name compression.
  /// Throws InvalidRecordValueError on names or payloads that cannot be encoded.
  std::vector<uint8_t> encode() const;

  /// Parse a complete message. Throws MalformedMessageError.
  static Message decode(const std::vector<uint8_t>& vData);

  /// The TSIG RR when the message carries one as its final record.
  const ResourceRecord* tsigRecord() const;
};

/// Appends one uncompressed resource record, RDLENGTH included.
void appendRecord(std::vector<uint8_t>& vOut, const ResourceRecord& rr);

/// Reads the message ID from the first two octets of an encoded message.
uint16_t peekId(const std::vector<uint8_t>& vData);

/// Overwrites the message ID in an encoded message.
void pokeId(std::vector<uint8_t>& vData, uint16_t uId);

}  // namespace rfc2136::wire
