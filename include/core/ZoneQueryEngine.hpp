#pragma once

#include <stop_token>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "transport/TransportClient.hpp"
#include "wire/Message.hpp"

namespace rfc2136::core {

/// Enumerates a zone with a single ANY query.
/// Class abbreviation: zqe
class ZoneQueryEngine {
 public:
  explicit ZoneQueryEngine(transport::TransportClient& tcClient);

  /// Answer records in server order, unfiltered (SOA and NS included).
  /// Transport and classification errors propagate unchanged.
  std::vector<common::Record> query(const std::string& sZone, const std::string& sNameserver,
                                    std::stop_token stToken);

  /// QUERY for (zone, ANY, IN) with recursion desired.
  static wire::Message buildQuery(const std::string& sZone);

 private:
  transport::TransportClient& _tcClient;
};

}  // namespace rfc2136::core
