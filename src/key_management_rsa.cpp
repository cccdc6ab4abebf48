#include <string>

#include "jose/content_crypto.hpp"
#include "jose/crypto.hpp"
#include "jose/error.hpp"
#include "jose/key_management.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace {

rsa::Padding paddingFor(JweAlgorithm alg) {
  switch (alg) {
    case JweAlgorithm::RSA1_5:
      return rsa::Padding::PKCS1_V1_5;
    case JweAlgorithm::RSA_OAEP:
      return rsa::Padding::OAEP_SHA1;
    case JweAlgorithm::RSA_OAEP_256:
      return rsa::Padding::OAEP_SHA256;
    default:
      throw UnsupportedAlgorithmError(
          unsupportedJweAlgorithm(name(alg), algorithms::RSA));
  }
}

}  // namespace

CekResult RsaKeyManagement::produceCek(const JweHeader& header,
                                       const CryptoContext& ctx) const {
  const auto padding = paddingFor(header.algorithm());
  auto cek = content_crypto::generateCek(header.encryptionMethod(), ctx);
  auto encrypted = rsa::encrypt(key_.get(), padding, cek, ctx);
  return CekResult{std::move(cek), Base64Url::encode(encrypted), header};
}

SecretBytes RsaKeyManagement::recoverCek(
    const JweHeader& header, const std::optional<Base64Url>& encrypted_key,
    const CryptoContext& ctx) const {
  const auto padding = paddingFor(header.algorithm());
  if (!key_.hasPrivateKey()) {
    throw InvalidKeyError("RSA decryption requires a private key");
  }
  const auto& ek = key_management::requireEncryptedKey(encrypted_key);
  const auto ciphertext = ek.decode();
  const auto enc = header.encryptionMethod();

  if (padding == rsa::Padding::PKCS1_V1_5) {
    // Drawn before the RSA operation and returned on any failure, so a bad
    // padding and a good one take the same path up to content decryption.
    // Nothing is logged here.
    auto substitute = content_crypto::generateCek(enc, ctx);
    try {
      auto cek = rsa::decrypt(key_.get(), padding, ciphertext, ctx);
      if (cek.size() != substitute.size()) return substitute;
      return cek;
    } catch (const CryptoError&) {
      return substitute;
    }
  }

  SecretBytes cek;
  try {
    cek = rsa::decrypt(key_.get(), padding, ciphertext, ctx);
  } catch (const CryptoError& e) {
    JOSE_LOG_DEBUG("RSA-OAEP decryption failed: {}", e.what());
    throw DecryptionError();
  }
  if (cek.size() != cekByteLength(enc)) {
    JOSE_LOG_DEBUG("RSA-OAEP CEK has the wrong length for {}", name(enc));
    throw DecryptionError();
  }
  return cek;
}

}  // namespace jose
