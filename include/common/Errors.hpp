#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sessiondb::common {

/// Base error for all session store exceptions.
/// Carries a machine-readable error code slug.
/// Storage failures are not wrapped: pqxx exceptions reach the caller as-is.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;

  explicit AppError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Textual session id that does not parse into the two-integer scheme.
/// Raised before any storage access.
struct InvalidSessionIdError : AppError {
  explicit InvalidSessionIdError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// Rejected configuration: empty table name, empty query, missing collaborator,
/// out-of-range environment value.
struct ConfigurationError : AppError {
  explicit ConfigurationError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// Attribute value could not be encoded to or decoded from bytes.
struct SerializationError : AppError {
  explicit SerializationError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

}  // namespace sessiondb::common
