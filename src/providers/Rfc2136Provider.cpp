#include "providers/Rfc2136Provider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/NameserverResolver.hpp"
#include "transport/SocketTransport.hpp"

namespace rfc2136::providers {

namespace {

common::ProviderConfig checked(common::ProviderConfig pcConfig) {
  if (pcConfig.sNameserver.empty()) {
    throw common::ValidationError("Rfc2136Provider requires a nameserver address");
  }
  if (pcConfig.durTimeout.count() <= 0 ||
      pcConfig.durTimeout > common::ProviderConfig::kMaxTimeout) {
    throw common::ValidationError("Rfc2136Provider requires a timeout between 1 and " +
                                  std::to_string(common::ProviderConfig::kMaxTimeout.count()) +
                                  " ms");
  }
  return pcConfig;
}

}  // anonymous namespace

std::shared_ptr<const security::TsigSigner> Rfc2136Provider::makeSigner(
    const common::ProviderConfig& pcConfig) {
  if (!pcConfig.oTsig) {
    return nullptr;
  }
  if (!pcConfig.oTsig->active()) {
    common::Logger::get()->warn(
        "TSIG key name or secret missing; requests to {} will be unsigned",
        pcConfig.sNameserver);
    return nullptr;
  }
  return std::make_shared<const security::TsigSigner>(*pcConfig.oTsig);
}

Rfc2136Provider::Rfc2136Provider(common::ProviderConfig pcConfig)
    : Rfc2136Provider(pcConfig, std::make_shared<transport::SocketTransport>(
                                    pcConfig.tkTransport, pcConfig.durTimeout)) {}

Rfc2136Provider::Rfc2136Provider(common::ProviderConfig pcConfig,
                                 std::shared_ptr<transport::ITransport> spTransport)
    : _pcConfig(checked(std::move(pcConfig))),
      _upClient(std::make_unique<transport::TransportClient>(std::move(spTransport),
                                                             makeSigner(_pcConfig))),
      _zqeEngine(*_upClient),
      _tbBuilder(*_upClient) {
  common::Logger::get()->debug("Rfc2136Provider ready (nameserver={}, transport={}, tsig={})",
                               _pcConfig.sNameserver,
                               common::Config::transportName(_pcConfig.tkTransport),
                               _pcConfig.oTsig && _pcConfig.oTsig->active() ? "on" : "off");
}

Rfc2136Provider::~Rfc2136Provider() = default;

std::string Rfc2136Provider::name() const { return "rfc2136"; }

common::ListResult Rfc2136Provider::getRecords(const std::string& sZone,
                                               std::stop_token stToken) {
  std::lock_guard<std::mutex> lock(_mtx);

  common::ListResult lr;
  try {
    const std::string sNameserver = core::NameserverResolver::normalize(_pcConfig.sNameserver);
    lr.vRecords = _zqeEngine.query(sZone, sNameserver, stToken);
    lr.bSuccess = true;
  } catch (const common::AppError& e) {
    lr.sErrorCode = e._sErrorCode;
    lr.sErrorMessage = "failed to list records in zone " + sZone + ": " + e.what();
    common::Logger::get()->warn("{}", lr.sErrorMessage);
  }
  return lr;
}

common::ChangeResult Rfc2136Provider::appendRecords(const std::string& sZone,
                                                    const std::vector<common::Record>& vRecords,
                                                    std::stop_token stToken) {
  return change(sZone, vRecords, core::ChangeMode::Append, stToken);
}

common::ChangeResult Rfc2136Provider::setRecords(const std::string& sZone,
                                                 const std::vector<common::Record>& vRecords,
                                                 std::stop_token stToken) {
  return change(sZone, vRecords, core::ChangeMode::Set, stToken);
}

common::ChangeResult Rfc2136Provider::deleteRecords(const std::string& sZone,
                                                    const std::vector<common::Record>& vRecords,
                                                    std::stop_token stToken) {
  return change(sZone, vRecords, core::ChangeMode::Delete, stToken);
}

common::ChangeResult Rfc2136Provider::change(const std::string& sZone,
                                             const std::vector<common::Record>& vRecords,
                                             core::ChangeMode cmMode, std::stop_token stToken) {
  std::lock_guard<std::mutex> lock(_mtx);

  const std::string sNameserver = core::NameserverResolver::normalize(_pcConfig.sNameserver);
  return _tbBuilder.apply(sZone, vRecords, cmMode, sNameserver, stToken);
}

}  // namespace rfc2136::providers
