#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace rfc2136::common {

/// Base error for all library-level exceptions.
/// Carries a machine-readable error code slug that survives conversion into
/// provider result structs.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;

  explicit AppError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Invalid configuration handed to a constructor (programmer misuse).
struct ValidationError : AppError {
  explicit ValidationError(std::string sMsg)
      : AppError("invalid_config", std::move(sMsg)) {}
};

/// Record type mnemonic outside the supported translation set.
struct UnsupportedRecordTypeError : AppError {
  std::string _sType;

  explicit UnsupportedRecordTypeError(std::string sType)
      : AppError("unsupported_record_type", "unsupported record type " + sType),
        _sType(std::move(sType)) {}
};

/// Record value that does not parse for its type (e.g. a bad IPv4 literal).
struct InvalidRecordValueError : AppError {
  explicit InvalidRecordValueError(std::string sMsg)
      : AppError("invalid_record_value", std::move(sMsg)) {}
};

/// Transport-level failure: timeout, refused connection, unreachable address.
struct NetworkError : AppError {
  explicit NetworkError(std::string sMsg)
      : AppError("network_failure", std::move(sMsg)) {}
};

/// Reply with a non-success response code.
struct ServerRejectedError : AppError {
  int _iRcode;
  std::string _sRcodeName;

  explicit ServerRejectedError(int iRcode, std::string sRcodeName, std::string sMsg)
      : AppError("server_rejected", std::move(sMsg)),
        _iRcode(iRcode),
        _sRcodeName(std::move(sRcodeName)) {}
};

/// Bytes that do not decode as a DNS message.
struct MalformedMessageError : AppError {
  explicit MalformedMessageError(std::string sMsg)
      : AppError("malformed_reply", std::move(sMsg)) {}
};

/// Missing or invalid TSIG signature on a message that should carry one.
struct TsigError : AppError {
  explicit TsigError(std::string sMsg)
      : AppError("authentication_failure", std::move(sMsg)) {}
};

/// Operation aborted because its stop token was triggered.
struct CancelledError : AppError {
  explicit CancelledError(std::string sMsg)
      : AppError("cancelled", std::move(sMsg)) {}
};

}  // namespace rfc2136::common
