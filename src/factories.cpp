#include "jose/factories.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "jose/ecdsa.hpp"
#include "jose/error.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace {

template <typename Alg, size_t N>
bool belongsTo(Alg alg, const Alg (&family)[N]) {
  return std::find(std::begin(family), std::end(family), alg) !=
         std::end(family);
}

template <typename Key>
const Key& requireKey(const JoseKey& key, std::string_view alg,
                      const char* expected) {
  const auto* typed = std::get_if<Key>(&key);
  if (!typed) {
    throw InvalidKeyError(std::string(alg) + " requires " + expected);
  }
  return *typed;
}

template <typename Key>
const Key& requirePrivateKey(const JoseKey& key, std::string_view alg,
                             const char* expected) {
  const auto& typed = requireKey<Key>(key, alg, expected);
  if (!typed.hasPrivateKey()) {
    throw InvalidKeyError(std::string(alg) + " decryption requires " +
                          expected + " with a private part");
  }
  return typed;
}

}  // namespace

KeyManagement makeKeyManagement(JweAlgorithm alg, const JoseKey& key) {
  const auto alg_name = name(alg);
  if (alg == JweAlgorithm::DIR) {
    return DirectKeyManagement(
        requireKey<SecretBytes>(key, alg_name, "a secret key"));
  }
  if (belongsTo(alg, algorithms::AES_KW)) {
    return AesKeyWrapManagement(
        alg, requireKey<SecretBytes>(key, alg_name, "a secret key"));
  }
  if (belongsTo(alg, algorithms::AES_GCM_KW)) {
    return AesGcmKeyWrapManagement(
        alg, requireKey<SecretBytes>(key, alg_name, "a secret key"));
  }
  if (belongsTo(alg, algorithms::RSA)) {
    return RsaKeyManagement(
        requirePrivateKey<RsaKey>(key, alg_name, "an RSA key"));
  }
  if (belongsTo(alg, algorithms::ECDH_ES)) {
    return EcdhKeyManagement(
        requirePrivateKey<EcKey>(key, alg_name, "an EC key"));
  }
  if (belongsTo(alg, algorithms::PBES2)) {
    return PasswordKeyManagement(
        requireKey<SecretBytes>(key, alg_name, "a password"));
  }
  throw UnsupportedAlgorithmError("Unsupported JWE algorithm " +
                                  std::string(alg_name));
}

JweDecrypter makeJweDecrypter(JweAlgorithm alg, const JoseKey& key,
                              CriticalParamsPolicy policy, CryptoContext ctx) {
  JOSE_LOG_DEBUG("Selecting a JWE decrypter for {}", name(alg));
  return JweDecrypter(makeKeyManagement(alg, key), std::move(policy),
                      std::move(ctx));
}

JweDecrypter makeJweDecrypter(const JweHeader& header, const JoseKey& key,
                              CriticalParamsPolicy policy, CryptoContext ctx) {
  auto km = makeKeyManagement(header.algorithm(), key);
  if (const auto* direct = std::get_if<DirectKeyManagement>(&km)) {
    auto methods = direct->compatibleEncryptionMethods();
    if (std::find(methods.begin(), methods.end(), header.encryptionMethod()) ==
        methods.end()) {
      throw KeyLengthError("the direct key length does not match " +
                           std::string(name(header.encryptionMethod())));
    }
  }
  return JweDecrypter(std::move(km), std::move(policy), std::move(ctx));
}

std::unique_ptr<JwsVerifier> makeJwsVerifier(JwsAlgorithm alg,
                                             const JoseKey& key,
                                             CriticalParamsPolicy policy,
                                             CryptoContext ctx) {
  const auto alg_name = name(alg);
  JOSE_LOG_DEBUG("Selecting a JWS verifier for {}", alg_name);
  if (belongsTo(alg, algorithms::HMAC)) {
    return std::make_unique<MacVerifier>(
        requireKey<SecretBytes>(key, alg_name, "a secret key"),
        std::move(policy), std::move(ctx));
  }
  if (belongsTo(alg, algorithms::RSASSA)) {
    return std::make_unique<RsaSsaVerifier>(
        requireKey<RsaKey>(key, alg_name, "an RSA key"), std::move(policy),
        std::move(ctx));
  }
  if (belongsTo(alg, algorithms::ECDSA)) {
    const auto& ec = requireKey<EcKey>(key, alg_name, "an EC key");
    const auto curve = ecdsa::resolveCurve(alg);
    if (ec.curve() != curve) {
      throw InvalidKeyError(std::string(alg_name) +
                            " requires an EC key on curve " +
                            std::string(curveInfo(curve).jwkName));
    }
    return std::make_unique<EcdsaVerifier>(ec, std::move(policy),
                                           std::move(ctx));
  }
  throw UnsupportedAlgorithmError("Unsupported JWS algorithm " +
                                  std::string(alg_name));
}

}  // namespace jose
