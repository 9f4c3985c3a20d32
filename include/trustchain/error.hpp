/**
 * @file error.hpp
 * @brief Error codes and exception hierarchy for TrustChain
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace trustchain {

/**
 * @brief Error codes for programmatic error handling
 */
enum class TcErrorCode : uint32_t {
  SUCCESS = 0,
  CANONICALIZATION_FAILED = 1000,
  INVALID_BASE64 = 1001,
  INVALID_ENVELOPE = 1002,
  SIGNING_FAILED = 2000,
  KEY_REVOKED = 2001,
  EXTERNAL_SIGNER_TIMEOUT = 2002,
  CRYPTO_OPERATION_FAILED = 2003,
  UNTRUSTED_SERVER = 3000,
  POLICY_DENIED = 3001,
  REGISTRY_SYNC_FAILED = 3002,
  CONFIGURATION_ERROR = 4000,
  OS_ERROR = 6000,
  MEMORY_ERROR = 6001,
  IO_ERROR = 6002,
  PERMISSION_ERROR = 6003,
  SYSTEM_CALL_FAILED = 6005
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(TcErrorCode code) noexcept {
  switch (code) {
    case TcErrorCode::SUCCESS:
      return "Success";
    case TcErrorCode::CANONICALIZATION_FAILED:
      return "Canonicalization failed";
    case TcErrorCode::INVALID_BASE64:
      return "Invalid base64 encoding";
    case TcErrorCode::INVALID_ENVELOPE:
      return "Invalid envelope";
    case TcErrorCode::SIGNING_FAILED:
      return "Signing failed";
    case TcErrorCode::KEY_REVOKED:
      return "Signing key is revoked";
    case TcErrorCode::EXTERNAL_SIGNER_TIMEOUT:
      return "External signer timed out";
    case TcErrorCode::CRYPTO_OPERATION_FAILED:
      return "Cryptographic operation failed";
    case TcErrorCode::UNTRUSTED_SERVER:
      return "Untrusted tool server";
    case TcErrorCode::POLICY_DENIED:
      return "Denied by policy";
    case TcErrorCode::REGISTRY_SYNC_FAILED:
      return "Trust registry sync failed";
    case TcErrorCode::CONFIGURATION_ERROR:
      return "Invalid configuration";
    case TcErrorCode::OS_ERROR:
      return "Operating system error";
    case TcErrorCode::MEMORY_ERROR:
      return "Memory allocation error";
    case TcErrorCode::IO_ERROR:
      return "Input/output error";
    case TcErrorCode::PERMISSION_ERROR:
      return "Permission denied";
    case TcErrorCode::SYSTEM_CALL_FAILED:
      return "System call failed";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all TrustChain errors
 */
class TrustChainError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with code and message
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit TrustChainError(TcErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  [[nodiscard]] TcErrorCode errorCode() const noexcept { return error_code_; }

 private:
  TcErrorCode error_code_;
};

/**
 * @brief Value cannot be represented canonically (excess depth, NaN, bad UTF-8)
 */
class CanonicalizationError : public TrustChainError {
 public:
  explicit CanonicalizationError(std::string_view details)
      : TrustChainError(TcErrorCode::CANONICALIZATION_FAILED,
                        std::string("Canonicalization failed: ") +
                            std::string(details)) {}
};

class InvalidBase64Error : public TrustChainError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : TrustChainError(TcErrorCode::INVALID_BASE64,
                        std::string("Invalid base64 encoding: ") +
                            std::string(details)) {}
};

class InvalidEnvelopeError : public TrustChainError {
 public:
  explicit InvalidEnvelopeError(std::string_view details)
      : TrustChainError(TcErrorCode::INVALID_ENVELOPE,
                        std::string("Invalid envelope: ") +
                            std::string(details)) {}
};

/**
 * @brief Signing could not be performed (key unavailable, signer unreachable)
 */
class SigningFailure : public TrustChainError {
 public:
  explicit SigningFailure(std::string_view details)
      : TrustChainError(TcErrorCode::SIGNING_FAILED,
                        std::string("Signing failed: ") +
                            std::string(details)) {}
};

/**
 * @brief Active key id is revoked; fatal until the key is rotated
 */
class RevokedKeyError : public TrustChainError {
 public:
  explicit RevokedKeyError(std::string_view key_id)
      : TrustChainError(TcErrorCode::KEY_REVOKED,
                        std::string("Signing key is revoked: ") +
                            std::string(key_id)),
        key_id_(key_id) {}

  [[nodiscard]] const std::string& keyId() const noexcept { return key_id_; }

 private:
  std::string key_id_;
};

class ExternalSignerTimeout : public TrustChainError {
 public:
  explicit ExternalSignerTimeout(std::string_view details)
      : TrustChainError(TcErrorCode::EXTERNAL_SIGNER_TIMEOUT,
                        std::string("External signer timed out: ") +
                            std::string(details)) {}
};

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public TrustChainError {
 public:
  explicit CryptoError(std::string_view details)
      : TrustChainError(TcErrorCode::CRYPTO_OPERATION_FAILED,
                        std::string("Cryptographic operation failed: ") +
                            std::string(details)) {}
};

/**
 * @brief Base for trust gate denials; always carries a deny code and reason
 */
class DenialError : public TrustChainError {
 public:
  DenialError(TcErrorCode code, std::string deny_code, std::string reason)
      : TrustChainError(code, reason),
        deny_code_(std::move(deny_code)),
        reason_(std::move(reason)) {}

  [[nodiscard]] const std::string& denyCode() const noexcept {
    return deny_code_;
  }
  [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

 private:
  std::string deny_code_;
  std::string reason_;
};

/**
 * @brief Target tool server is not trusted for the requested call
 */
class UntrustedServerError : public DenialError {
 public:
  UntrustedServerError(std::string deny_code, std::string reason)
      : DenialError(TcErrorCode::UNTRUSTED_SERVER, std::move(deny_code),
                    std::move(reason)) {}
};

/**
 * @brief Remote tool server rejected the call by policy
 */
class PolicyDeniedError : public DenialError {
 public:
  PolicyDeniedError(std::string deny_code, std::string reason)
      : DenialError(TcErrorCode::POLICY_DENIED, std::move(deny_code),
                    std::move(reason)) {}
};

class RegistrySyncError : public TrustChainError {
 public:
  explicit RegistrySyncError(std::string_view details)
      : TrustChainError(TcErrorCode::REGISTRY_SYNC_FAILED,
                        std::string("Trust registry sync failed: ") +
                            std::string(details)) {}
};

class ConfigurationError : public TrustChainError {
 public:
  explicit ConfigurationError(std::string_view details)
      : TrustChainError(TcErrorCode::CONFIGURATION_ERROR,
                        std::string("Invalid configuration: ") +
                            std::string(details)) {}
};

class OsError : public TrustChainError {
 public:
  explicit OsError(std::string_view details)
      : TrustChainError(TcErrorCode::OS_ERROR,
                        std::string("Operating system error: ") +
                            std::string(details)) {}
};

class MemoryError : public TrustChainError {
 public:
  explicit MemoryError(std::string_view details)
      : TrustChainError(TcErrorCode::MEMORY_ERROR,
                        std::string("Memory allocation error: ") +
                            std::string(details)) {}
};

/**
 * @brief Exception for I/O errors
 */
class IoError : public TrustChainError {
 public:
  explicit IoError(std::string_view details)
      : TrustChainError(TcErrorCode::IO_ERROR,
                        std::string("Input/output error: ") +
                            std::string(details)) {}
};

class PermissionError : public TrustChainError {
 public:
  explicit PermissionError(std::string_view details)
      : TrustChainError(TcErrorCode::PERMISSION_ERROR,
                        std::string("Permission denied: ") +
                            std::string(details)) {}
};

class SystemCallError : public TrustChainError {
 public:
  explicit SystemCallError(std::string_view details)
      : TrustChainError(TcErrorCode::SYSTEM_CALL_FAILED,
                        std::string("System call failed: ") +
                            std::string(details)) {}
};

/**
 * @brief Result type for error handling without exceptions
 */
template <typename T, typename E = TrustChainError>
class Result {
 public:
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  static Result success(T value) { return Result(std::move(value)); }
  static Result error(E error) { return Result(std::move(error)); }

  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Value access (throws if error)
  const T& value() const& {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::move(std::get<T>(data_));
  }

  const T& valueOr(const T& defaultValue) const& noexcept {
    return isSuccess() ? std::get<T>(data_) : defaultValue;
  }

  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

 private:
  std::variant<T, E> data_;
};

template <typename T>
using TcResult = Result<T, TrustChainError>;

/**
 * @brief Throw the OS exception matching an errno value
 */
inline void throwOsError(const std::string& operation, int error_code = errno) {
  std::string error_msg = std::strerror(error_code);

  switch (error_code) {
    case EACCES:
    case EPERM:
      throw PermissionError(operation + ": " + error_msg);
    case ENOMEM:
      throw MemoryError(operation + ": " + error_msg);
    case EIO:
    case ENOENT:
    case EISDIR:
    case ENOTDIR:
    case ENOSPC:
      throw IoError(operation + ": " + error_msg);
    default:
      throw SystemCallError(operation + ": " + error_msg);
  }
}

}  // namespace trustchain
