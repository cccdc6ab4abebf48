/**
 * @file error.hpp
 * @brief Error classes and exception hierarchy for JOSE processing
 */

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jose {

/**
 * @brief Error codes for programmatic error handling
 */
enum class JoseErrorCode : uint32_t {
  SUCCESS = 0,
  MALFORMED_INPUT = 1000,
  INVALID_JSON = 1001,
  INVALID_BASE64 = 1002,
  INVALID_STATE = 1003,
  DECRYPTION_FAILED = 2000,
  UNSUPPORTED_ALGORITHM = 3000,
  CRYPTO_OPERATION_FAILED = 3001,
  INVALID_KEY = 3002,
  INVALID_KEY_LENGTH = 3003,
  INVALID_CONFIGURATION = 3004,
  OS_ERROR = 6000,
  MEMORY_ERROR = 6001,
  IO_ERROR = 6002,
  PERMISSION_ERROR = 6003,
  RESOURCE_EXHAUSTED = 6004,
  SYSTEM_CALL_FAILED = 6005
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(JoseErrorCode code) noexcept {
  switch (code) {
    case JoseErrorCode::SUCCESS:
      return "Success";
    case JoseErrorCode::MALFORMED_INPUT:
      return "Malformed input";
    case JoseErrorCode::INVALID_JSON:
      return "Invalid JSON";
    case JoseErrorCode::INVALID_BASE64:
      return "Invalid base64url encoding";
    case JoseErrorCode::INVALID_STATE:
      return "Invalid object state";
    case JoseErrorCode::DECRYPTION_FAILED:
      return "Decryption failed";
    case JoseErrorCode::UNSUPPORTED_ALGORITHM:
      return "Unsupported algorithm";
    case JoseErrorCode::CRYPTO_OPERATION_FAILED:
      return "Cryptographic operation failed";
    case JoseErrorCode::INVALID_KEY:
      return "Invalid key";
    case JoseErrorCode::INVALID_KEY_LENGTH:
      return "Invalid key length";
    case JoseErrorCode::INVALID_CONFIGURATION:
      return "Invalid configuration";
    case JoseErrorCode::OS_ERROR:
      return "Operating system error";
    case JoseErrorCode::MEMORY_ERROR:
      return "Memory allocation error";
    case JoseErrorCode::IO_ERROR:
      return "Input/output error";
    case JoseErrorCode::PERMISSION_ERROR:
      return "Permission denied";
    case JoseErrorCode::RESOURCE_EXHAUSTED:
      return "System resource exhausted";
    case JoseErrorCode::SYSTEM_CALL_FAILED:
      return "System call failed";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all JOSE errors
 */
class JoseError : public std::runtime_error {
 public:
  /**
   * @brief Construct a JOSE error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit JoseError(JoseErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  [[nodiscard]] JoseErrorCode errorCode() const noexcept { return error_code_; }

 private:
  JoseErrorCode error_code_;
};

/**
 * @brief Structurally invalid input: wrong part count, missing IV, tag or
 * encrypted key, missing required header parameter
 */
class MalformedInputError : public JoseError {
 public:
  explicit MalformedInputError(std::string_view details)
      : JoseError(JoseErrorCode::MALFORMED_INPUT,
                  std::string("Malformed input: ") + std::string(details)) {}
};

class ParseError : public JoseError {
 public:
  explicit ParseError(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_JSON,
                  std::string("Invalid JSON: ") + std::string(details)) {}
};

class InvalidBase64Error : public JoseError {
 public:
  explicit InvalidBase64Error(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_BASE64,
                  std::string("Invalid base64url encoding: ") +
                      std::string(details)) {}
};

/**
 * @brief Raised when a JOSE object is used in the wrong lifecycle state,
 * e.g. serializing an object that was never encrypted
 */
class InvalidStateError : public JoseError {
 public:
  explicit InvalidStateError(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_STATE, details) {}
};

/**
 * @brief Authentication or decryption failure
 *
 * The message is fixed on purpose. Tag mismatch, padding failure, key unwrap
 * failure, rejected critical parameters and inflate failure all raise this
 * same error with the same text.
 */
class DecryptionError : public JoseError {
 public:
  DecryptionError() : JoseError(JoseErrorCode::DECRYPTION_FAILED) {}
};

/**
 * @brief Algorithm or encryption method outside the supported set; the
 * message names the accepted values
 */
class UnsupportedAlgorithmError : public JoseError {
 public:
  explicit UnsupportedAlgorithmError(std::string_view details)
      : JoseError(JoseErrorCode::UNSUPPORTED_ALGORITHM, details) {}
};

/**
 * @brief Exception for cryptographic operation failures
 */
class CryptoError : public JoseError {
 public:
  explicit CryptoError(std::string_view details)
      : JoseError(JoseErrorCode::CRYPTO_OPERATION_FAILED,
                  std::string("Cryptographic operation failed: ") +
                      std::string(details)) {}
};

class InvalidKeyError : public JoseError {
 public:
  explicit InvalidKeyError(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_KEY,
                  std::string("Invalid key: ") + std::string(details)) {}
};

/**
 * @brief Key length does not match what the algorithm or encryption method
 * requires
 */
class KeyLengthError : public JoseError {
 public:
  explicit KeyLengthError(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_KEY_LENGTH,
                  std::string("Invalid key length: ") + std::string(details)) {}
};

class ConfigurationError : public JoseError {
 public:
  explicit ConfigurationError(std::string_view details)
      : JoseError(JoseErrorCode::INVALID_CONFIGURATION,
                  std::string("Invalid configuration: ") +
                      std::string(details)) {}
};

/**
 * @brief Exception for OS-related errors
 */
class OsError : public JoseError {
 public:
  explicit OsError(std::string_view details)
      : JoseError(JoseErrorCode::OS_ERROR,
                  std::string("Operating system error: ") +
                      std::string(details)) {}
};

class MemoryError : public JoseError {
 public:
  explicit MemoryError(std::string_view details)
      : JoseError(JoseErrorCode::MEMORY_ERROR,
                  std::string("Memory allocation error: ") +
                      std::string(details)) {}
};

class IoError : public JoseError {
 public:
  explicit IoError(std::string_view details)
      : JoseError(JoseErrorCode::IO_ERROR,
                  std::string("Input/output error: ") + std::string(details)) {}
};

class PermissionError : public JoseError {
 public:
  explicit PermissionError(std::string_view details)
      : JoseError(JoseErrorCode::PERMISSION_ERROR,
                  std::string("Permission denied: ") + std::string(details)) {}
};

class ResourceExhaustedError : public JoseError {
 public:
  explicit ResourceExhaustedError(std::string_view details)
      : JoseError(JoseErrorCode::RESOURCE_EXHAUSTED,
                  std::string("System resource exhausted: ") +
                      std::string(details)) {}
};

class SystemCallError : public JoseError {
 public:
  explicit SystemCallError(std::string_view details)
      : JoseError(JoseErrorCode::SYSTEM_CALL_FAILED,
                  std::string("System call failed: ") + std::string(details)) {}
};

/**
 * @brief Throw the OS exception matching an errno value
 * @param operation Name of the failing call, used as message prefix
 * @param error_code errno value
 */
[[noreturn]] inline void throwOsError(const std::string& operation,
                                      int error_code = errno) {
#ifdef _WIN32
  std::string error_msg;
  char buffer[256];
  if (strerror_s(buffer, sizeof(buffer), error_code) == 0) {
    error_msg = buffer;
  } else {
    error_msg = "Unknown error";
  }
#else
  std::string error_msg = std::strerror(error_code);
#endif

  switch (error_code) {
    case EACCES:
#ifndef _WIN32
    case EPERM:
#endif
      throw PermissionError(operation + ": " + error_msg);
    case ENOMEM:
      throw MemoryError(operation + ": " + error_msg);
    case EMFILE:
#ifndef _WIN32
    case ENFILE:
#endif
    case ENOSPC:
      throw ResourceExhaustedError(operation + ": " + error_msg);
    case EIO:
      throw IoError(operation + ": " + error_msg);
    default:
      throw SystemCallError(operation + ": " + error_msg);
  }
}

}  // namespace jose
