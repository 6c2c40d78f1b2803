#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "providers/IProvider.hpp"

namespace rfc2136::providers {

/// Creates concrete IProvider instances by type string.
class ProviderFactory {
 public:
  /// sType "rfc2136" with a ProviderConfig JSON object.
  /// Throws ValidationError on an unknown type or a bad config.
  static std::unique_ptr<IProvider> create(const std::string& sType,
                                           const nlohmann::json& jConfig);
};

}  // namespace rfc2136::providers
