/**
 * @file algorithm.hpp
 * @brief JWA algorithm identifiers (RFC 7518) and their wire names
 */

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace jose {

/**
 * @brief JWE key management algorithms ("alg")
 */
enum class JweAlgorithm {
  RSA1_5,
  RSA_OAEP,
  RSA_OAEP_256,
  A128KW,
  A192KW,
  A256KW,
  DIR,
  ECDH_ES,
  ECDH_ES_A128KW,
  ECDH_ES_A192KW,
  ECDH_ES_A256KW,
  A128GCMKW,
  A192GCMKW,
  A256GCMKW,
  PBES2_HS256_A128KW,
  PBES2_HS384_A192KW,
  PBES2_HS512_A256KW
};

/**
 * @brief JWE content encryption methods ("enc")
 *
 * A128CBC_HS256_LEGACY and A256CBC_HS512_LEGACY are the pre-RFC
 * "A128CBC+HS256" and "A256CBC+HS512" methods of JWE draft 08.
 */
enum class EncryptionMethod {
  A128CBC_HS256,
  A192CBC_HS384,
  A256CBC_HS512,
  A128GCM,
  A192GCM,
  A256GCM,
  A128CBC_HS256_LEGACY,
  A256CBC_HS512_LEGACY
};

/**
 * @brief JWS signature algorithms
 */
enum class JwsAlgorithm {
  HS256,
  HS384,
  HS512,
  RS256,
  RS384,
  RS512,
  PS256,
  PS384,
  PS512,
  ES256,
  ES384,
  ES512
};

enum class CompressionAlgorithm { DEF };

enum class ContentFamily { AES_CBC_HMAC, AES_GCM, AES_CBC_HMAC_LEGACY };

/**
 * @brief Static properties of a content encryption method
 *
 * For AES_CBC_HMAC the CEK is split into a MAC key followed by an
 * encryption key and the tag is the MAC truncated to tagLength. For
 * AES_CBC_HMAC_LEGACY the CEK is the content master key from which the
 * encryption and integrity keys are derived; the tag is the full MAC.
 */
struct EncryptionMethodInfo {
  std::string_view name;
  size_t cekBitLength;
  ContentFamily family;
  size_t macKeyLength;
  size_t encKeyLength;
  size_t tagLength;
  std::string_view digest;
};

const EncryptionMethodInfo& methodInfo(EncryptionMethod enc);

inline size_t cekByteLength(EncryptionMethod enc) {
  return methodInfo(enc).cekBitLength / 8;
}

std::string_view name(JweAlgorithm alg) noexcept;
std::string_view name(EncryptionMethod enc) noexcept;
std::string_view name(JwsAlgorithm alg) noexcept;
std::string_view name(CompressionAlgorithm zip) noexcept;

std::optional<JweAlgorithm> jweAlgorithmFromName(std::string_view value);
std::optional<EncryptionMethod> encryptionMethodFromName(
    std::string_view value);
std::optional<JwsAlgorithm> jwsAlgorithmFromName(std::string_view value);
std::optional<CompressionAlgorithm> compressionFromName(
    std::string_view value);

namespace algorithms {

inline constexpr JweAlgorithm RSA[] = {
    JweAlgorithm::RSA1_5, JweAlgorithm::RSA_OAEP, JweAlgorithm::RSA_OAEP_256};
inline constexpr JweAlgorithm AES_KW[] = {
    JweAlgorithm::A128KW, JweAlgorithm::A192KW, JweAlgorithm::A256KW};
inline constexpr JweAlgorithm AES_GCM_KW[] = {JweAlgorithm::A128GCMKW,
                                              JweAlgorithm::A192GCMKW,
                                              JweAlgorithm::A256GCMKW};
inline constexpr JweAlgorithm ECDH_ES[] = {
    JweAlgorithm::ECDH_ES, JweAlgorithm::ECDH_ES_A128KW,
    JweAlgorithm::ECDH_ES_A192KW, JweAlgorithm::ECDH_ES_A256KW};
inline constexpr JweAlgorithm PBES2[] = {JweAlgorithm::PBES2_HS256_A128KW,
                                         JweAlgorithm::PBES2_HS384_A192KW,
                                         JweAlgorithm::PBES2_HS512_A256KW};
inline constexpr JweAlgorithm DIRECT[] = {JweAlgorithm::DIR};

inline constexpr EncryptionMethod ALL_ENC[] = {
    EncryptionMethod::A128CBC_HS256,        EncryptionMethod::A192CBC_HS384,
    EncryptionMethod::A256CBC_HS512,        EncryptionMethod::A128GCM,
    EncryptionMethod::A192GCM,              EncryptionMethod::A256GCM,
    EncryptionMethod::A128CBC_HS256_LEGACY, EncryptionMethod::A256CBC_HS512_LEGACY};

inline constexpr JwsAlgorithm HMAC[] = {JwsAlgorithm::HS256, JwsAlgorithm::HS384,
                                        JwsAlgorithm::HS512};
inline constexpr JwsAlgorithm RSASSA[] = {
    JwsAlgorithm::RS256, JwsAlgorithm::RS384, JwsAlgorithm::RS512,
    JwsAlgorithm::PS256, JwsAlgorithm::PS384, JwsAlgorithm::PS512};
inline constexpr JwsAlgorithm ECDSA[] = {JwsAlgorithm::ES256, JwsAlgorithm::ES384,
                                         JwsAlgorithm::ES512};

}  // namespace algorithms

/**
 * @brief Join names as "A", "A or B", "A, B or C"
 */
std::string itemize(const std::vector<std::string_view>& names);

template <typename E>
std::string itemize(std::span<const E> values) {
  std::vector<std::string_view> names;
  names.reserve(values.size());
  for (const auto& v : values) names.push_back(name(v));
  return itemize(names);
}

std::string unsupportedJweAlgorithm(std::string_view unsupported,
                                    std::span<const JweAlgorithm> supported);
std::string unsupportedEncryptionMethod(
    std::string_view unsupported, std::span<const EncryptionMethod> supported);
std::string unsupportedJwsAlgorithm(std::string_view unsupported,
                                    std::span<const JwsAlgorithm> supported);

}  // namespace jose
