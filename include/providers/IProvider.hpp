#pragma once

#include <stop_token>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace rfc2136::providers {

/// Pure abstract interface for DNS record providers.
/// Expected failures are reported through the result structs, never thrown.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;

  /// Every record currently published in sZone.
  virtual common::ListResult getRecords(const std::string& sZone, std::stop_token stToken) = 0;

  /// Adds each record alongside whatever already exists.
  virtual common::ChangeResult appendRecords(const std::string& sZone,
                                             const std::vector<common::Record>& vRecords,
                                             std::stop_token stToken) = 0;

  /// Replaces the RRset of each record's type with that record.
  virtual common::ChangeResult setRecords(const std::string& sZone,
                                          const std::vector<common::Record>& vRecords,
                                          std::stop_token stToken) = 0;

  /// Removes exactly the given records.
  virtual common::ChangeResult deleteRecords(const std::string& sZone,
                                             const std::vector<common::Record>& vRecords,
                                             std::stop_token stToken) = 0;
};

}  // namespace rfc2136::providers
