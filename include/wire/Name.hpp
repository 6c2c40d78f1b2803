#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rfc2136::wire {

inline constexpr std::size_t kMaxLabelLength = 63;
inline constexpr std::size_t kMaxNameLength = 255;

/// Appends the root label when missing. The empty string becomes ".".
std::string fqdn(const std::string& sName);

/// Lower-cased fully qualified form, as used for TSIG key and algorithm names.
std::string canonicalName(const std::string& sName);

/// Case-insensitive comparison of two names after qualification.
bool equalNames(const std::string& sLeft, const std::string& sRight);

/// Appends the uncompressed wire form of a presentation-format name.
/// Understands "\." and "\DDD" escapes. Throws InvalidRecordValueError on
/// empty interior labels or length overflow.
void appendName(std::vector<uint8_t>& vOut, const std::string& sName);

/// Reads a possibly compressed name at nOffset and advances nOffset past it.
/// Compression pointers must point strictly backwards, which rules out loops.
/// Throws MalformedMessageError on truncation or bad label types.
std::string readName(const uint8_t* pData, std::size_t nSize, std::size_t& nOffset);

}  // namespace rfc2136::wire
