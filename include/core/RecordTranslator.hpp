#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"
#include "wire/Message.hpp"

namespace rfc2136::core {

/// Record types that can be written to a nameserver.
enum class SupportedType { A, Aaaa, Cname, Mx, Txt };

/// Bidirectional mapping between provider records and wire resource records.
/// Class abbreviation: N/A (static interface)
class RecordTranslator {
 public:
  /// Case-insensitive lookup in the writable type set.
  static std::optional<SupportedType> parseType(const std::string& sType);

  /// Builds the wire record for rec. The owner name is the zone itself, not
  /// rec.sName. Class is IN; TTL is clamped into uint32 seconds.
  /// MX values are "<preference> <exchange>" or a bare exchange (preference 0).
  /// TXT values longer than 255 octets are split into consecutive chunks.
  /// Throws UnsupportedRecordTypeError or InvalidRecordValueError; no partial
  /// record is produced.
  static wire::ResourceRecord toWire(const std::string& sZone, const common::Record& rec);

  /// Inverse mapping: mnemonic from the type code, value in presentation form.
  static common::Record fromWire(const wire::ResourceRecord& rr);

  /// Presentation form of the RDATA alone, e.g. "10 mail.example.org.".
  static std::string renderValue(const wire::ResourceRecord& rr);
};

}  // namespace rfc2136::core
