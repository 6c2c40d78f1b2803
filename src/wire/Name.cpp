#include "wire/Name.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace rfc2136::wire {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

/// Splits a presentation name into raw labels, resolving escapes.
std::vector<std::string> splitLabels(const std::string& sName) {
  std::vector<std::string> vLabels;
  if (sName.empty() || sName == ".") {
    return vLabels;
  }

  std::string sLabel;
  for (std::size_t i = 0; i < sName.size(); ++i) {
    const char c = sName[i];
    if (c == '\\') {
      if (i + 3 < sName.size() && isDigit(sName[i + 1]) && isDigit(sName[i + 2]) &&
          isDigit(sName[i + 3])) {
        const int iValue = (sName[i + 1] - '0') * 100 + (sName[i + 2] - '0') * 10 +
                           (sName[i + 3] - '0');
        if (iValue > 255) {
          throw common::InvalidRecordValueError("invalid escape in domain name " + sName);
        }
        sLabel.push_back(static_cast<char>(iValue));
        i += 3;
      } else if (i + 1 < sName.size()) {
        sLabel.push_back(sName[++i]);
      } else {
        throw common::InvalidRecordValueError("dangling escape in domain name " + sName);
      }
    } else if (c == '.') {
      if (sLabel.empty()) {
        throw common::InvalidRecordValueError("empty label in domain name " + sName);
      }
      vLabels.push_back(std::move(sLabel));
      sLabel.clear();
    } else {
      sLabel.push_back(c);
    }
  }
  if (!sLabel.empty()) {
    vLabels.push_back(std::move(sLabel));
  }
  return vLabels;
}

void appendEscapedLabel(std::string& sOut, const uint8_t* pLabel, std::size_t nLength) {
  for (std::size_t i = 0; i < nLength; ++i) {
    const auto c = static_cast<unsigned char>(pLabel[i]);
    if (c == '.' || c == '\\' || c == '"' || c == '(' || c == ')' || c == ';' || c == '@' ||
        c == '$') {
      sOut.push_back('\\');
      sOut.push_back(static_cast<char>(c));
    } else if (c <= 0x20 || c >= 0x7f) {
      char vBuf[5];
      std::snprintf(vBuf, sizeof(vBuf), "\\%03u", static_cast<unsigned>(c));
      sOut.append(vBuf);
    } else {
      sOut.push_back(static_cast<char>(c));
    }
  }
}

}  // namespace

std::string fqdn(const std::string& sName) {
  if (sName.empty()) return ".";
  if (sName.back() == '.') {
    // An escaped trailing dot ("a\.") is part of the label, not the root
    std::size_t nBackslashes = 0;
    for (auto it = sName.rbegin() + 1; it != sName.rend() && *it == '\\'; ++it) {
      ++nBackslashes;
    }
    if (nBackslashes % 2 == 0) return sName;
  }
  return sName + ".";
}

std::string canonicalName(const std::string& sName) {
  std::string sResult = fqdn(sName);
  std::transform(sResult.begin(), sResult.end(), sResult.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sResult;
}

bool equalNames(const std::string& sLeft, const std::string& sRight) {
  return canonicalName(sLeft) == canonicalName(sRight);
}

void appendName(std::vector<uint8_t>& vOut, const std::string& sName) {
  const auto vLabels = splitLabels(sName);

  std::size_t nWireLength = 1;
  for (const auto& sLabel : vLabels) {
    if (sLabel.size() > kMaxLabelLength) {
      throw common::InvalidRecordValueError("label longer than 63 octets in domain name " + sName);
    }
    nWireLength += sLabel.size() + 1;
  }
  if (nWireLength > kMaxNameLength) {
    throw common::InvalidRecordValueError("domain name longer than 255 octets: " + sName);
  }

  for (const auto& sLabel : vLabels) {
    vOut.push_back(static_cast<uint8_t>(sLabel.size()));
    vOut.insert(vOut.end(), sLabel.begin(), sLabel.end());
  }
  vOut.push_back(0);
}

std::string readName(const uint8_t* pData, std::size_t nSize, std::size_t& nOffset) {
  std::string sName;
  std::size_t nPos = nOffset;
  std::size_t nWireLength = 1;
  bool bJumped = false;

  while (true) {
    if (nPos >= nSize) {
      throw common::MalformedMessageError("truncated domain name at offset " +
                                          std::to_string(nPos));
    }
    const uint8_t uLength = pData[nPos];

    if ((uLength & 0xC0) == 0xC0) {
      if (nPos + 1 >= nSize) {
        throw common::MalformedMessageError("truncated compression pointer");
      }
      const std::size_t nTarget = (static_cast<std::size_t>(uLength & 0x3F) << 8) | pData[nPos + 1];
      if (nTarget >= nPos) {
        throw common::MalformedMessageError("compression pointer does not point backwards");
      }
      if (!bJumped) {
        nOffset = nPos + 2;
        bJumped = true;
      }
      nPos = nTarget;
      continue;
    }
    if ((uLength & 0xC0) != 0) {
      throw common::MalformedMessageError("unsupported label type in domain name");
    }

    if (uLength == 0) {
      if (!bJumped) {
        nOffset = nPos + 1;
      }
      break;
    }

    if (nPos + 1 + uLength > nSize) {
      throw common::MalformedMessageError("label runs past end of message");
    }
    nWireLength += uLength + 1;
    if (nWireLength > kMaxNameLength) {
      throw common::MalformedMessageError("domain name longer than 255 octets");
    }
    appendEscapedLabel(sName, pData + nPos + 1, uLength);
    sName.push_back('.');
    nPos += 1 + uLength;
  }

  return sName.empty() ? std::string(".") : sName;
}

}  // namespace rfc2136::wire
