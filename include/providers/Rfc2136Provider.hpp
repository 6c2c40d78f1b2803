#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/Config.hpp"
#include "core/TransactionBuilder.hpp"
#include "core/ZoneQueryEngine.hpp"
#include "providers/IProvider.hpp"
#include "security/TsigSigner.hpp"
#include "transport/ITransport.hpp"
#include "transport/TransportClient.hpp"

namespace rfc2136::providers {

/// RFC2136 dynamic update provider with optional TSIG.
/// All public operations hold one provider-wide lock for their full duration,
/// so calls on the same instance never interleave, even across zones.
/// Class abbreviation: rp
class Rfc2136Provider : public IProvider {
 public:
  /// Uses a SocketTransport built from the config.
  /// Throws ValidationError on an empty nameserver or bad TSIG settings.
  explicit Rfc2136Provider(common::ProviderConfig pcConfig);

  /// Injects the transport (tests, alternative sockets).
  Rfc2136Provider(common::ProviderConfig pcConfig, std::shared_ptr<transport::ITransport> spTransport);
  ~Rfc2136Provider() override;

  std::string name() const override;

  common::ListResult getRecords(const std::string& sZone, std::stop_token stToken) override;
  common::ChangeResult appendRecords(const std::string& sZone,
                                     const std::vector<common::Record>& vRecords,
                                     std::stop_token stToken) override;
  common::ChangeResult setRecords(const std::string& sZone,
                                  const std::vector<common::Record>& vRecords,
                                  std::stop_token stToken) override;
  common::ChangeResult deleteRecords(const std::string& sZone,
                                     const std::vector<common::Record>& vRecords,
                                     std::stop_token stToken) override;

 private:
  common::ChangeResult change(const std::string& sZone,
                              const std::vector<common::Record>& vRecords,
                              core::ChangeMode cmMode, std::stop_token stToken);

  static std::shared_ptr<const security::TsigSigner> makeSigner(
      const common::ProviderConfig& pcConfig);

  common::ProviderConfig _pcConfig;
  std::unique_ptr<transport::TransportClient> _upClient;
  core::ZoneQueryEngine _zqeEngine;
  core::TransactionBuilder _tbBuilder;
  std::mutex _mtx;
};

}  // namespace rfc2136::providers
