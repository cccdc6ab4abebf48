/**
 * @file crypto_context.hpp
 * @brief OpenSSL library context and property query used for every
 * algorithm fetch and random draw
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "secure_vector.hpp"

typedef struct ossl_lib_ctx_st OSSL_LIB_CTX;

namespace jose {

/**
 * @brief Immutable selection of the OpenSSL provider set
 *
 * Ciphers, digests, MACs, KDFs and key operations are fetched from the
 * library context with the property query (for example "provider=fips" or
 * "fips=yes"). Random bytes come from the DRBG of the same context. The
 * default-constructed context uses the OpenSSL default library context.
 *
 * The library context is not owned and must outlive every strategy built
 * with it. Copies are cheap and safe to share between threads.
 */
class CryptoContext {
 public:
  CryptoContext() = default;

  explicit CryptoContext(OSSL_LIB_CTX* library_context,
                         std::string property_query = {})
      : library_context_(library_context),
        property_query_(std::move(property_query)) {}

  [[nodiscard]] OSSL_LIB_CTX* libraryContext() const noexcept {
    return library_context_;
  }

  /// Property query string, or nullptr when none was configured
  [[nodiscard]] const char* propertyQuery() const noexcept {
    return property_query_.empty() ? nullptr : property_query_.c_str();
  }

  /**
   * @brief Fill a buffer from the context's DRBG
   * @throws CryptoError or an OS error if the generator fails
   */
  void randomBytes(std::span<uint8_t> out) const;

  [[nodiscard]] std::vector<uint8_t> randomBytes(size_t count) const;

  /// Random bytes in secure storage, for keys
  [[nodiscard]] SecretBytes randomSecret(size_t count) const;

  /// Shared default instance (OpenSSL default library context)
  static const CryptoContext& defaultContext() noexcept;

 private:
  OSSL_LIB_CTX* library_context_ = nullptr;
  std::string property_query_;
};

}  // namespace jose
