/**
 * @file factories.hpp
 * @brief Selection of a JWE decrypter or JWS verifier from the header
 * algorithm and a key
 */

#pragma once

#include <memory>
#include <variant>

#include "jwe.hpp"
#include "jwk.hpp"
#include "jws.hpp"
#include "secure_vector.hpp"

namespace jose {

/**
 * @brief Key material handed to the factories: a shared secret (also a
 * PBES2 password), an RSA key or an EC key
 */
using JoseKey = std::variant<SecretBytes, RsaKey, EcKey>;

/**
 * @brief Key management strategy for "alg"
 *
 * The "A*KW" and "A*GCMKW" strategies are pinned to "alg", so a KEK of a
 * different size is rejected here rather than at decryption.
 *
 * @throws InvalidKeyError if the key type does not belong to "alg", or an
 * RSA or EC key has no private part
 * @throws KeyLengthError if a secret does not fit "alg"
 */
KeyManagement makeKeyManagement(JweAlgorithm alg, const JoseKey& key);

JweDecrypter makeJweDecrypter(
    JweAlgorithm alg, const JoseKey& key, CriticalParamsPolicy policy = {},
    CryptoContext ctx = CryptoContext::defaultContext());

/**
 * @brief As above, also checking a "dir" key against "enc"
 * @throws KeyLengthError if a direct key does not fit "enc"
 */
JweDecrypter makeJweDecrypter(
    const JweHeader& header, const JoseKey& key,
    CriticalParamsPolicy policy = {},
    CryptoContext ctx = CryptoContext::defaultContext());

/**
 * @brief HMAC, RSASSA or ECDSA verifier for "alg"
 * @throws InvalidKeyError if the key type does not belong to "alg", or an
 * EC key is on a curve other than the one "alg" names
 * @throws KeyLengthError for an HMAC secret shorter than 256 bits
 */
std::unique_ptr<JwsVerifier> makeJwsVerifier(
    JwsAlgorithm alg, const JoseKey& key, CriticalParamsPolicy policy = {},
    CryptoContext ctx = CryptoContext::defaultContext());

}  // namespace jose
