#include "core/TransactionBuilder.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RecordTranslator.hpp"
#include "wire/Name.hpp"
#include "wire/RecordType.hpp"

namespace rfc2136::core {

std::string changeModeName(ChangeMode cmMode) {
  switch (cmMode) {
    case ChangeMode::Append: return "append";
    case ChangeMode::Delete: return "delete";
    case ChangeMode::Set: return "set";
  }
  return "change";
}

wire::Message ZoneUpdate::toMessage() const {
  wire::Message msg;
  msg.uOpcode = wire::kOpcodeUpdate;
  msg.vQuestions.push_back({wire::fqdn(sZone), wire::kTypeSoa, wire::kClassIn});
  msg.vAuthority.reserve(vRemovals.size() + vInsertions.size());
  msg.vAuthority.insert(msg.vAuthority.end(), vRemovals.begin(), vRemovals.end());
  msg.vAuthority.insert(msg.vAuthority.end(), vInsertions.begin(), vInsertions.end());
  return msg;
}

TransactionBuilder::TransactionBuilder(transport::TransportClient& tcClient)
    : _tcClient(tcClient) {}

ZoneUpdate TransactionBuilder::build(const std::string& sZone, const common::Record& rec,
                                     ChangeMode cmMode) {
  wire::ResourceRecord rr = RecordTranslator::toWire(sZone, rec);

  ZoneUpdate zu;
  zu.sZone = wire::fqdn(sZone);

  switch (cmMode) {
    case ChangeMode::Append:
      zu.vInsertions.push_back(std::move(rr));
      break;
    case ChangeMode::Delete:
      // RFC2136 §2.5.4: delete an RR from an RRset
      rr.uClass = wire::kClassNone;
      rr.uTtl = 0;
      zu.vRemovals.push_back(std::move(rr));
      break;
    case ChangeMode::Set: {
      // RFC2136 §2.5.2: delete an RRset
      wire::ResourceRecord rrDelete;
      rrDelete.sName = rr.sName;
      rrDelete.uType = rr.uType;
      rrDelete.uClass = wire::kClassAny;
      rrDelete.uTtl = 0;
      rrDelete.rdData = wire::OpaqueData{};
      zu.vRemovals.push_back(std::move(rrDelete));
      zu.vInsertions.push_back(std::move(rr));
      break;
    }
  }
  return zu;
}

common::ChangeResult TransactionBuilder::apply(const std::string& sZone,
                                               const std::vector<common::Record>& vRecords,
                                               ChangeMode cmMode, const std::string& sNameserver,
                                               std::stop_token stToken) {
  auto spLog = common::Logger::get();
  const std::string sMode = changeModeName(cmMode);

  common::ChangeResult cr;
  cr.vApplied.reserve(vRecords.size());

  for (const auto& rec : vRecords) {
    if (stToken.stop_requested()) {
      cr.sErrorCode = "cancelled";
      cr.sErrorMessage = "failed to " + sMode + " record " + rec.sName + " " + rec.sType +
                         ": operation cancelled";
      spLog->warn("{} on zone {} cancelled after {} record(s)", sMode, sZone,
                  cr.vApplied.size());
      return cr;
    }

    try {
      const ZoneUpdate zu = build(sZone, rec, cmMode);
      _tcClient.exchange(zu.toMessage(), sNameserver, stToken);
    } catch (const common::AppError& e) {
      cr.sErrorCode = e._sErrorCode;
      cr.sErrorMessage =
          "failed to " + sMode + " record " + rec.sName + " " + rec.sType + ": " + e.what();
      spLog->warn("{} on zone {} stopped: {}", sMode, sZone, cr.sErrorMessage);
      return cr;
    }

    cr.vApplied.push_back(rec);
    spLog->info("Applied {} of {} {} in zone {}", sMode, rec.sName, rec.sType, sZone);
  }

  cr.bSuccess = true;
  return cr;
}

}  // namespace rfc2136::core
