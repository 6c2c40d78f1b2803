#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace rfc2136::common {

/// Protocol-agnostic DNS record exchanged with provider callers.
/// Class abbreviation: rec
struct Record {
  std::string sName;
  std::string sType;
  std::string sValue;
  std::chrono::seconds durTtl{0};

  bool operator==(const Record&) const = default;
};

/// Socket flavour used for nameserver exchanges.
enum class TransportKind { Udp, Tcp };

/// Result of a list operation.
/// Class abbreviation: lr
struct ListResult {
  bool bSuccess = false;
  std::vector<Record> vRecords;
  std::string sErrorCode;
  std::string sErrorMessage;
};

/// Result of an append/set/delete operation. vApplied holds every record
/// that was committed before processing stopped.
/// Class abbreviation: cr
struct ChangeResult {
  bool bSuccess = false;
  std::vector<Record> vApplied;
  std::string sErrorCode;
  std::string sErrorMessage;
};

}  // namespace rfc2136::common
