#include "core/ZoneQueryEngine.hpp"

#include "common/Logger.hpp"
#include "core/RecordTranslator.hpp"
#include "wire/Name.hpp"
#include "wire/RecordType.hpp"

namespace rfc2136::core {

ZoneQueryEngine::ZoneQueryEngine(transport::TransportClient& tcClient) : _tcClient(tcClient) {}

wire::Message ZoneQueryEngine::buildQuery(const std::string& sZone) {
  wire::Message msg;
  msg.uOpcode = wire::kOpcodeQuery;
  msg.bRecursionDesired = true;
  msg.vQuestions.push_back({wire::fqdn(sZone), wire::kTypeAny, wire::kClassIn});
  return msg;
}

std::vector<common::Record> ZoneQueryEngine::query(const std::string& sZone,
                                                   const std::string& sNameserver,
                                                   std::stop_token stToken) {
  const wire::Message msgReply = _tcClient.exchange(buildQuery(sZone), sNameserver, stToken);

  std::vector<common::Record> vRecords;
  vRecords.reserve(msgReply.vAnswers.size());
  for (const auto& rr : msgReply.vAnswers) {
    vRecords.push_back(RecordTranslator::fromWire(rr));
  }

  common::Logger::get()->debug("Zone {} returned {} record(s)", sZone, vRecords.size());
  return vRecords;
}

}  // namespace rfc2136::core
