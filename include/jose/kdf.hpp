/**
 * @file kdf.hpp
 * @brief Concatenation KDF (NIST SP 800-56A, RFC 7518 section 4.6) and the
 * pre-RFC CEK/CIK derivation used by A128CBC+HS256 and A256CBC+HS512
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "algorithm.hpp"
#include "crypto_context.hpp"
#include "secure_vector.hpp"

namespace jose {
namespace concat_kdf {

/**
 * @brief Derive a key from a shared secret
 * @param shared_secret Z
 * @param key_bit_length Requested key length in bits
 * @param other_info AlgorithmID || PartyUInfo || PartyVInfo || SuppPubInfo
 * || SuppPrivInfo
 * @param digest_name OpenSSL digest name; "SHA256" for ECDH-ES
 */
SecretBytes deriveKey(std::span<const uint8_t> shared_secret,
                      size_t key_bit_length,
                      std::span<const uint8_t> other_info,
                      std::string_view digest_name, const CryptoContext& ctx);

/// Number of digest rounds needed to produce key_bits
size_t computeDigestCycles(size_t digest_bits, size_t key_bits) noexcept;

std::vector<uint8_t> composeOtherInfo(std::span<const uint8_t> algorithm_id,
                                      std::span<const uint8_t> party_u_info,
                                      std::span<const uint8_t> party_v_info,
                                      std::span<const uint8_t> supp_pub_info,
                                      std::span<const uint8_t> supp_priv_info);

std::vector<uint8_t> encodeNoData();

/// 32-bit big-endian integer
std::vector<uint8_t> encodeIntData(uint32_t value);

/// 32-bit big-endian length followed by the UTF-8 bytes
std::vector<uint8_t> encodeStringData(std::string_view value);

/// 32-bit big-endian length followed by the bytes
std::vector<uint8_t> encodeDataWithLength(std::span<const uint8_t> data);

}  // namespace concat_kdf

/**
 * @brief Key derivation of JWE draft 08 for the "+" CBC/HMAC methods
 *
 * The content master key (CMK) yields a content encryption key labelled
 * "Encryption" and a content integrity key labelled "Integrity", each from
 * one round of SHA-256 or SHA-512 depending on the CMK length. epu and epv
 * are the optional legacy party info header parameters.
 */
namespace legacy_kdf {

SecretBytes generateCek(std::span<const uint8_t> cmk, EncryptionMethod enc,
                        const std::optional<std::vector<uint8_t>>& epu,
                        const std::optional<std::vector<uint8_t>>& epv,
                        const CryptoContext& ctx);

SecretBytes generateCik(std::span<const uint8_t> cmk, EncryptionMethod enc,
                        const std::optional<std::vector<uint8_t>>& epu,
                        const std::optional<std::vector<uint8_t>>& epv,
                        const CryptoContext& ctx);

}  // namespace legacy_kdf
}  // namespace jose
