#include "core/NameserverResolver.hpp"

#include "common/Logger.hpp"

#include <arpa/inet.h>

#include <algorithm>

namespace rfc2136::core {

namespace {

bool isIpv6Literal(const std::string& sHost) {
  in6_addr addr{};
  return inet_pton(AF_INET6, sHost.c_str(), &addr) == 1;
}

std::string skipped(const std::string& sAddress, const char* pReason) {
  common::Logger::get()->warn("Nameserver address '{}' {}; passing it through unchanged",
                              sAddress, pReason);
  return sAddress;
}

}  // namespace

std::string NameserverResolver::normalize(const std::string& sAddress) {
  if (sAddress.empty()) {
    return skipped(sAddress, "is empty");
  }

  if (sAddress.front() == '[') {
    const auto nClose = sAddress.find(']');
    if (nClose == std::string::npos) {
      return skipped(sAddress, "has an unterminated '['");
    }
    if (nClose == sAddress.size() - 1) {
      return sAddress + ":" + kDefaultDnsPort;
    }
    if (sAddress[nClose + 1] == ':') {
      return sAddress;  // explicit port
    }
    return skipped(sAddress, "has text after ']' that is not a port");
  }

  const auto nColons = std::count(sAddress.begin(), sAddress.end(), ':');
  if (nColons == 0) {
    return sAddress + ":" + kDefaultDnsPort;
  }
  if (nColons == 1) {
    return sAddress;  // explicit port
  }
  if (isIpv6Literal(sAddress)) {
    return "[" + sAddress + "]:" + kDefaultDnsPort;
  }
  return skipped(sAddress, "has too many colons");
}

}  // namespace rfc2136::core
