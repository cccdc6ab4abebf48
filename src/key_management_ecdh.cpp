#include <string>

#include "jose/content_crypto.hpp"
#include "jose/crypto.hpp"
#include "jose/error.hpp"
#include "jose/kdf.hpp"
#include "jose/key_management.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace ecdh_es {

size_t sharedKeyLength(JweAlgorithm alg, EncryptionMethod enc) {
  switch (alg) {
    case JweAlgorithm::ECDH_ES:
      return methodInfo(enc).cekBitLength;
    case JweAlgorithm::ECDH_ES_A128KW:
      return 128;
    case JweAlgorithm::ECDH_ES_A192KW:
      return 192;
    case JweAlgorithm::ECDH_ES_A256KW:
      return 256;
    default:
      throw UnsupportedAlgorithmError(
          unsupportedJweAlgorithm(name(alg), algorithms::ECDH_ES));
  }
}

SecretBytes deriveSharedKey(const JweHeader& header,
                            std::span<const uint8_t> shared_secret,
                            const CryptoContext& ctx) {
  const auto alg = header.algorithm();
  const auto enc = header.encryptionMethod();
  const auto key_bits = sharedKeyLength(alg, enc);

  // AlgorithmID is "enc" in direct mode and "alg" with key wrapping
  auto algorithm_id = concat_kdf::encodeStringData(
      alg == JweAlgorithm::ECDH_ES ? name(enc) : name(alg));
  auto apu = header.agreementPartyUInfo();
  auto apv = header.agreementPartyVInfo();
  auto party_u = concat_kdf::encodeDataWithLength(
      apu ? apu->decode() : std::vector<uint8_t>{});
  auto party_v = concat_kdf::encodeDataWithLength(
      apv ? apv->decode() : std::vector<uint8_t>{});
  auto supp_pub = concat_kdf::encodeIntData(static_cast<uint32_t>(key_bits));
  auto supp_priv = concat_kdf::encodeNoData();

  auto other_info = concat_kdf::composeOtherInfo(algorithm_id, party_u, party_v,
                                                 supp_pub, supp_priv);
  return concat_kdf::deriveKey(shared_secret, key_bits, other_info, "SHA256",
                               ctx);
}

}  // namespace ecdh_es

namespace {

bool isKeyWrapMode(JweAlgorithm alg) { return alg != JweAlgorithm::ECDH_ES; }

// Validate "epk" against the recipient's curve. Any problem is reported as
// a decryption failure.
EcKey ephemeralKeyFrom(const JweHeader& header, Curve expected,
                       const CryptoContext& ctx) {
  const auto* epk = header.ephemeralPublicKey();
  if (!epk) {
    throw MalformedInputError("missing \"epk\" header parameter");
  }
  try {
    auto kty = epk->find("kty");
    auto crv = epk->find("crv");
    if (kty == epk->end() || *kty != "EC" || crv == epk->end() ||
        !crv->is_string() ||
        curveFromName(crv->get<std::string>()) != expected) {
      JOSE_LOG_DEBUG("Ephemeral key is not on the recipient's curve");
      throw DecryptionError();
    }
    auto x = base64UrlDecode(epk->at("x").get<std::string>());
    auto y = base64UrlDecode(epk->at("y").get<std::string>());
    if (!isPointOnCurve(expected, x, y, ctx)) {
      JOSE_LOG_DEBUG("Ephemeral public key is not a point on {}",
                     curveInfo(expected).jwkName);
      throw DecryptionError();
    }
    return EcKey::fromCoordinates(expected, x, y, ctx);
  } catch (const DecryptionError&) {
    throw;
  } catch (const JoseError& e) {
    JOSE_LOG_DEBUG("Invalid ephemeral public key: {}", e.what());
    throw DecryptionError();
  } catch (const nlohmann::json::exception& e) {
    JOSE_LOG_DEBUG("Invalid ephemeral public key: {}", e.what());
    throw DecryptionError();
  }
}

}  // namespace

CekResult EcdhKeyManagement::produceCek(const JweHeader& header,
                                        const CryptoContext& ctx) const {
  const auto alg = header.algorithm();
  auto ephemeral = EcKey::generate(key_.curve(), ctx);
  auto shared_secret =
      ecdh::deriveSharedSecret(ephemeral.get(), key_.get(), ctx);

  auto derived = JweHeader::Builder(header)
                     .ephemeralPublicKey(ephemeral.toPublicJwk())
                     .build();
  auto shared_key = ecdh_es::deriveSharedKey(derived, shared_secret, ctx);

  if (!isKeyWrapMode(alg)) {
    return CekResult{std::move(shared_key), std::nullopt, std::move(derived)};
  }
  auto cek = content_crypto::generateCek(header.encryptionMethod(), ctx);
  auto wrapped = aes_kw::wrap(shared_key, cek, ctx);
  return CekResult{std::move(cek), Base64Url::encode(wrapped),
                   std::move(derived)};
}

SecretBytes EcdhKeyManagement::recoverCek(
    const JweHeader& header, const std::optional<Base64Url>& encrypted_key,
    const CryptoContext& ctx) const {
  if (!key_.hasPrivateKey()) {
    throw InvalidKeyError("ECDH decryption requires a private key");
  }
  const auto alg = header.algorithm();
  const auto enc = header.encryptionMethod();
  if (isKeyWrapMode(alg)) {
    key_management::requireEncryptedKey(encrypted_key);
  } else {
    key_management::rejectEncryptedKey(encrypted_key);
  }

  auto ephemeral = ephemeralKeyFrom(header, key_.curve(), ctx);

  SecretBytes shared_key;
  try {
    auto shared_secret =
        ecdh::deriveSharedSecret(key_.get(), ephemeral.get(), ctx);
    shared_key = ecdh_es::deriveSharedKey(header, shared_secret, ctx);
  } catch (const CryptoError& e) {
    JOSE_LOG_DEBUG("ECDH key agreement failed: {}", e.what());
    throw DecryptionError();
  }

  if (!isKeyWrapMode(alg)) return shared_key;

  auto cek = aes_kw::unwrap(shared_key, encrypted_key->decode(), ctx);
  if (cek.size() != cekByteLength(enc)) {
    JOSE_LOG_DEBUG("Unwrapped CEK has the wrong length for {}", name(enc));
    throw DecryptionError();
  }
  return cek;
}

}  // namespace jose
