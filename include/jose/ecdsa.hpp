/**
 * @file ecdsa.hpp
 * @brief ECDSA curve/algorithm binding and signature transcoding between
 * DER (as produced by OpenSSL) and the fixed R || S form of JWS
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "algorithm.hpp"
#include "jwk.hpp"

namespace jose {
namespace ecdsa {

/// ES256 for P-256, ES384 for P-384, ES512 for P-521
JwsAlgorithm resolveAlgorithm(Curve curve) noexcept;

/// @throws UnsupportedAlgorithmError for a non-ECDSA algorithm
Curve resolveCurve(JwsAlgorithm alg);

/**
 * @brief Length of the R || S signature: 64, 96 or 132 bytes
 * @throws UnsupportedAlgorithmError for a non-ECDSA algorithm
 */
size_t signatureByteArrayLength(JwsAlgorithm alg);

/**
 * @brief DER ECDSA-Sig-Value to R || S, each left-padded to half of
 * output_length
 * @throws CryptoError for malformed DER or an integer that does not fit
 */
std::vector<uint8_t> transcodeSignatureToConcat(std::span<const uint8_t> der,
                                                size_t output_length);

/**
 * @brief R || S to DER
 * @throws CryptoError for an empty or odd-length input
 */
std::vector<uint8_t> transcodeSignatureToDer(std::span<const uint8_t> concat);

}  // namespace ecdsa
}  // namespace jose
