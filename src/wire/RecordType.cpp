#include "wire/RecordType.hpp"

#include <array>
#include <utility>

namespace rfc2136::wire {

namespace {

constexpr std::array<std::pair<uint16_t, const char*>, 12> kTypeNames{{
    {kTypeA, "A"},
    {kTypeNs, "NS"},
    {kTypeCname, "CNAME"},
    {kTypeSoa, "SOA"},
    {kTypePtr, "PTR"},
    {kTypeMx, "MX"},
    {kTypeTxt, "TXT"},
    {kTypeAaaa, "AAAA"},
    {kTypeSrv, "SRV"},
    {kTypeOpt, "OPT"},
    {kTypeTsig, "TSIG"},
    {kTypeAny, "ANY"},
}};

constexpr std::array<std::pair<int, const char*>, 14> kRcodeNames{{
    {kRcodeNoError, "NOERROR"},
    {kRcodeFormErr, "FORMERR"},
    {kRcodeServFail, "SERVFAIL"},
    {kRcodeNxDomain, "NXDOMAIN"},
    {kRcodeNotImp, "NOTIMP"},
    {kRcodeRefused, "REFUSED"},
    {kRcodeYxDomain, "YXDOMAIN"},
    {kRcodeYxRrset, "YXRRSET"},
    {kRcodeNxRrset, "NXRRSET"},
    {kRcodeNotAuth, "NOTAUTH"},
    {kRcodeNotZone, "NOTZONE"},
    {kRcodeBadSig, "BADSIG"},
    {kRcodeBadKey, "BADKEY"},
    {kRcodeBadTime, "BADTIME"},
}};

}  // namespace

std::string typeToString(uint16_t uType) {
  for (const auto& [uCode, pName] : kTypeNames) {
    if (uCode == uType) return pName;
  }
  return "TYPE" + std::to_string(uType);
}

std::string rcodeToString(int iRcode) {
  for (const auto& [iCode, pName] : kRcodeNames) {
    if (iCode == iRcode) return pName;
  }
  return "RCODE" + std::to_string(iRcode);
}

}  // namespace rfc2136::wire
