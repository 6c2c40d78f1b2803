#include "providers/ProviderFactory.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "providers/Rfc2136Provider.hpp"

namespace rfc2136::providers {

std::unique_ptr<IProvider> ProviderFactory::create(const std::string& sType,
                                                   const nlohmann::json& jConfig) {
  if (sType == "rfc2136") {
    return std::make_unique<Rfc2136Provider>(common::ProviderConfig::fromJson(jConfig));
  }
  throw common::ValidationError("Unknown provider type: " + sType);
}

}  // namespace rfc2136::providers
