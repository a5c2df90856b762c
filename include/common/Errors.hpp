#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace kes::common {

/// Base error for all application-level exceptions.
/// Carries a machine-readable error code slug.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;

  explicit AppError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Missing or invalid configuration. Fatal at startup.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// Fetch capability failure. Recovered by the change detector (logged, cycle skipped).
/// _iHttpStatus is the upstream status, 0 when no response was received.
struct FetchError : AppError {
  int _iHttpStatus;

  explicit FetchError(int iHttpStatus, std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)), _iHttpStatus(iHttpStatus) {}
};

/// Connection refused, timeout, TLS handshake failure.
struct TransportError : FetchError {
  explicit TransportError(std::string sCode, std::string sMsg)
      : FetchError(0, std::move(sCode), std::move(sMsg)) {}
};

/// 401 / 403 from the API server.
struct AuthorizationError : FetchError {
  explicit AuthorizationError(int iHttpStatus, std::string sCode, std::string sMsg)
      : FetchError(iHttpStatus, std::move(sCode), std::move(sMsg)) {}
};

/// Response body is not a usable resource list.
struct MalformedResponseError : FetchError {
  explicit MalformedResponseError(std::string sCode, std::string sMsg)
      : FetchError(200, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace kes::common
