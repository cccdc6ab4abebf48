/**
 * @file content_crypto.hpp
 * @brief JWE content encryption: AAD assembly, the AES_CBC_HMAC_SHA2
 * composite (RFC 7518 section 5.2), AES-GCM and the legacy draft 08
 * CBC/HMAC methods, dispatched by "enc"
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "algorithm.hpp"
#include "base64.hpp"
#include "crypto.hpp"
#include "crypto_context.hpp"
#include "header.hpp"
#include "secure_vector.hpp"

namespace jose {

/**
 * @brief The five parts of a compact JWE, plus the header they belong to
 *
 * encryptedKey is absent for "dir" and "ECDH-ES".
 */
struct JweCryptoParts {
  JweHeader header;
  std::optional<Base64Url> encryptedKey;
  Base64Url iv;
  Base64Url cipherText;
  Base64Url authTag;
};

namespace aad {

/// ASCII bytes of the header's base64url encoding
std::vector<uint8_t> compute(const Header& header);

std::vector<uint8_t> compute(const Base64Url& encoded_header);

/// AAD length in bits as a 64-bit big-endian integer (the "AL" value)
std::array<uint8_t, 8> computeLength(std::span<const uint8_t> aad);

}  // namespace aad

namespace cbc_hmac {

/**
 * @brief CEK split into MAC key (first half) and encryption key (second
 * half), with the MAC truncation length of the method
 */
struct CompositeKey {
  SecretBytes macKey;
  SecretBytes encKey;
  size_t truncatedMacLength;
  std::string_view digest;
};

/**
 * @throws KeyLengthError unless the key is 256, 384 or 512 bits
 */
CompositeKey splitKey(std::span<const uint8_t> cek);

AuthenticatedCipherText encryptAuthenticated(std::span<const uint8_t> cek,
                                             std::span<const uint8_t> iv,
                                             std::span<const uint8_t> plaintext,
                                             std::span<const uint8_t> aad,
                                             const CryptoContext& ctx);

/**
 * @brief Verify the tag and decrypt
 *
 * CBC decryption runs whether or not the tag matched, and a tag mismatch or
 * a padding failure both raise DecryptionError afterwards.
 */
std::vector<uint8_t> decryptAuthenticated(std::span<const uint8_t> cek,
                                          std::span<const uint8_t> iv,
                                          std::span<const uint8_t> ciphertext,
                                          std::span<const uint8_t> aad,
                                          std::span<const uint8_t> tag,
                                          const CryptoContext& ctx);

}  // namespace cbc_hmac

/**
 * @brief A128CBC+HS256 and A256CBC+HS512 of JWE draft 08
 *
 * The CEK is a content master key. Encryption and integrity keys are derived
 * from it with legacy_kdf, and the MAC covers the ASCII text
 * header "." encryptedKey "." iv "." ciphertext, all base64url, with an empty
 * middle segment when there is no encrypted key.
 */
namespace legacy_cbc_hmac {

AuthenticatedCipherText encrypt(const JweHeader& header,
                                std::span<const uint8_t> cmk,
                                const std::optional<Base64Url>& encrypted_key,
                                std::span<const uint8_t> iv,
                                std::span<const uint8_t> plaintext,
                                const CryptoContext& ctx);

std::vector<uint8_t> decrypt(const JweHeader& header,
                             std::span<const uint8_t> cmk,
                             const std::optional<Base64Url>& encrypted_key,
                             const Base64Url& iv, const Base64Url& cipher_text,
                             const Base64Url& auth_tag,
                             const CryptoContext& ctx);

}  // namespace legacy_cbc_hmac

namespace content_crypto {

std::span<const EncryptionMethod> supportedEncryptionMethods() noexcept;

/// Methods whose CEK has the given bit length
std::vector<EncryptionMethod> compatibleEncryptionMethods(
    size_t key_bit_length);

/// Fresh random CEK of the length "enc" requires
SecretBytes generateCek(EncryptionMethod enc, const CryptoContext& ctx);

/**
 * @brief Compress (if "zip" is set), compute the AAD from the final header
 * and encrypt
 * @param header Final header; nothing may change it after this call
 * @throws KeyLengthError if the CEK does not fit "enc"
 */
JweCryptoParts encrypt(const JweHeader& header,
                       std::span<const uint8_t> plaintext,
                       std::span<const uint8_t> cek,
                       std::optional<Base64Url> encrypted_key,
                       const CryptoContext& ctx);

/**
 * @brief Authenticate, decrypt and decompress
 * @throws DecryptionError for every authentication, padding or inflate
 * failure
 */
std::vector<uint8_t> decrypt(const JweHeader& header,
                             const std::optional<Base64Url>& encrypted_key,
                             const Base64Url& iv, const Base64Url& cipher_text,
                             const Base64Url& auth_tag,
                             std::span<const uint8_t> cek,
                             const CryptoContext& ctx);

}  // namespace content_crypto
}  // namespace jose
