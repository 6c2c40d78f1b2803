#pragma once

#include <stop_token>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "transport/TransportClient.hpp"
#include "wire/Message.hpp"

namespace rfc2136::core {

/// How a record is applied to the zone.
enum class ChangeMode { Append, Delete, Set };

/// "append", "delete" or "set".
std::string changeModeName(ChangeMode cmMode);

/// One UPDATE transaction: removal directives first, then insertions.
/// Class abbreviation: zu
struct ZoneUpdate {
  std::string sZone;
  std::vector<wire::ResourceRecord> vRemovals;
  std::vector<wire::ResourceRecord> vInsertions;

  /// UPDATE message with zone section (zone, SOA, IN) and the directives in
  /// the update (authority) section.
  wire::Message toMessage() const;
};

/// Builds and sends one UPDATE per record.
/// Class abbreviation: tb
class TransactionBuilder {
 public:
  explicit TransactionBuilder(transport::TransportClient& tcClient);

  /// Append inserts the record. Delete removes exactly that value (class NONE).
  /// Set removes the whole RRset for the type (class ANY) before inserting.
  /// Throws UnsupportedRecordTypeError or InvalidRecordValueError.
  static ZoneUpdate build(const std::string& sZone, const common::Record& rec, ChangeMode cmMode);

  /// Applies vRecords in order and stops at the first failure. vApplied holds
  /// the records committed before that point.
  common::ChangeResult apply(const std::string& sZone, const std::vector<common::Record>& vRecords,
                             ChangeMode cmMode, const std::string& sNameserver,
                             std::stop_token stToken);

 private:
  transport::TransportClient& _tcClient;
};

}  // namespace rfc2136::core
