/**
 * @file crypto.hpp
 * @brief Primitive adapters over OpenSSL 3: AES-CBC, AES-GCM, AES key wrap,
 * RSA encryption, ECDH, HMAC, message digests and PBKDF2
 *
 * Every adapter fetches its algorithm through the supplied CryptoContext.
 * Adapters know nothing about JOSE headers; the content and key management
 * layers compose them.
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "crypto_context.hpp"
#include "error.hpp"
#include "secure_vector.hpp"

typedef struct evp_pkey_st EVP_PKEY;
typedef struct bio_st BIO;

namespace jose {

namespace crypto_constants {
constexpr size_t AES128_KEY_SIZE = 16;
constexpr size_t AES192_KEY_SIZE = 24;
constexpr size_t AES256_KEY_SIZE = 32;
constexpr size_t AES_BLOCK_SIZE = 16;
constexpr size_t CBC_IV_SIZE = 16;   ///< 128-bit IV for AES-CBC
constexpr size_t GCM_IV_SIZE = 12;   ///< 96-bit IV for AES-GCM
constexpr size_t GCM_TAG_SIZE = 16;  ///< 128-bit GCM authentication tag
constexpr size_t KW_OVERHEAD = 8;    ///< RFC 3394 integrity block
constexpr size_t MIN_RSA_MODULUS_BITS = 2048;

constexpr bool is_valid_aes_key_size(size_t size) noexcept {
  return size == AES128_KEY_SIZE || size == AES192_KEY_SIZE ||
         size == AES256_KEY_SIZE;
}
}  // namespace crypto_constants

struct EvpKeyDeleter {
  void operator()(EVP_PKEY* key) const noexcept;
};
using EvpKeyPtr = std::unique_ptr<EVP_PKEY, EvpKeyDeleter>;

struct BioDeleter {
  void operator()(BIO* bio) const noexcept;
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/**
 * @brief Contiguous byte containers accepted by the templated entry points
 */
template <typename T>
concept ByteData = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Ciphertext and authentication tag of an AEAD encryption
 */
struct AuthenticatedCipherText {
  std::vector<uint8_t> cipherText;
  std::vector<uint8_t> authTag;
};

namespace aes_cbc {

/**
 * @brief AES/CBC/PKCS#7 encryption; the AES variant follows the key length
 */
std::vector<uint8_t> encrypt(std::span<const uint8_t> key,
                             std::span<const uint8_t> iv,
                             std::span<const uint8_t> plaintext,
                             const CryptoContext& ctx);

/**
 * @throws CryptoError on bad padding or wrong ciphertext length
 */
std::vector<uint8_t> decrypt(std::span<const uint8_t> key,
                             std::span<const uint8_t> iv,
                             std::span<const uint8_t> ciphertext,
                             const CryptoContext& ctx);

}  // namespace aes_cbc

namespace aes_gcm {

AuthenticatedCipherText encrypt(std::span<const uint8_t> key,
                                std::span<const uint8_t> iv,
                                std::span<const uint8_t> plaintext,
                                std::span<const uint8_t> aad,
                                const CryptoContext& ctx);

/**
 * @throws DecryptionError if the tag does not verify
 */
std::vector<uint8_t> decrypt(std::span<const uint8_t> key,
                             std::span<const uint8_t> iv,
                             std::span<const uint8_t> ciphertext,
                             std::span<const uint8_t> aad,
                             std::span<const uint8_t> tag,
                             const CryptoContext& ctx);

}  // namespace aes_gcm

namespace aes_kw {

/**
 * @brief RFC 3394 key wrap
 * @param kek 128, 192 or 256-bit key encryption key
 * @param key Key to wrap, a multiple of 64 bits and at least 128 bits
 */
std::vector<uint8_t> wrap(std::span<const uint8_t> kek,
                          std::span<const uint8_t> key,
                          const CryptoContext& ctx);

/**
 * @throws DecryptionError if the integrity check fails
 */
SecretBytes unwrap(std::span<const uint8_t> kek,
                   std::span<const uint8_t> wrapped,
                   const CryptoContext& ctx);

}  // namespace aes_kw

namespace rsa {

enum class Padding { PKCS1_V1_5, OAEP_SHA1, OAEP_SHA256 };

std::vector<uint8_t> encrypt(EVP_PKEY* public_key, Padding padding,
                             std::span<const uint8_t> plaintext,
                             const CryptoContext& ctx);

/**
 * @throws CryptoError on any padding or key failure
 */
SecretBytes decrypt(EVP_PKEY* private_key, Padding padding,
                    std::span<const uint8_t> ciphertext,
                    const CryptoContext& ctx);

size_t modulusBits(EVP_PKEY* key);

}  // namespace rsa

namespace ecdh {

/**
 * @brief Raw ECDH shared secret Z (the x coordinate of the shared point)
 */
SecretBytes deriveSharedSecret(EVP_PKEY* private_key, EVP_PKEY* peer_key,
                               const CryptoContext& ctx);

}  // namespace ecdh

namespace digest {

/// Digest size in bytes for an OpenSSL digest name such as "SHA256"
size_t size(std::string_view digest_name, const CryptoContext& ctx);

std::vector<uint8_t> compute(std::string_view digest_name,
                             std::span<const uint8_t> data,
                             const CryptoContext& ctx);

}  // namespace digest

namespace hmac {

std::vector<uint8_t> compute(std::string_view digest_name,
                             std::span<const uint8_t> key,
                             std::span<const uint8_t> data,
                             const CryptoContext& ctx);

}  // namespace hmac

namespace pbkdf2 {

/**
 * @brief PBKDF2 (RFC 8018) with HMAC over the named digest
 */
SecretBytes deriveKey(std::span<const uint8_t> password,
                      std::span<const uint8_t> salt, uint32_t iterations,
                      std::string_view digest_name, size_t key_length,
                      const CryptoContext& ctx);

}  // namespace pbkdf2

}  // namespace jose
