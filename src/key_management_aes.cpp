#include <string>

#include "jose/content_crypto.hpp"
#include "jose/crypto.hpp"
#include "jose/error.hpp"
#include "jose/key_management.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace {

JweAlgorithm algorithmForKek(std::optional<JweAlgorithm> alg, size_t kek_size,
                             std::string_view family) {
  if (!alg) {
    throw KeyLengthError(std::string(family) +
                         " key encryption key must be 128, 192 or 256 bits, "
                         "got " +
                         std::to_string(kek_size * 8));
  }
  return *alg;
}

void checkKekMatches(JweAlgorithm alg, std::span<const JweAlgorithm> family,
                     std::optional<JweAlgorithm> by_length) {
  key_management::ensureSupported(alg, family);
  if (by_length != alg) {
    throw KeyLengthError("the key encryption key length does not match " +
                         std::string(name(alg)));
  }
}

SecretBytes checkedCek(SecretBytes cek, EncryptionMethod enc) {
  if (cek.size() != cekByteLength(enc)) {
    JOSE_LOG_DEBUG("Unwrapped CEK has the wrong length for {}", name(enc));
    throw DecryptionError();
  }
  return cek;
}

}  // namespace

//
// AES key wrap
//

AesKeyWrapManagement::AesKeyWrapManagement(SecretBytes kek)
    : alg_(algorithmForKek(key_management::aesKeyWrapFor(kek.size()),
                           kek.size(), "AES key wrap")),
      kek_(std::move(kek)) {}

AesKeyWrapManagement::AesKeyWrapManagement(JweAlgorithm alg, SecretBytes kek)
    : alg_(alg), kek_(std::move(kek)) {
  checkKekMatches(alg_, algorithms::AES_KW,
                  key_management::aesKeyWrapFor(kek_.size()));
}

CekResult AesKeyWrapManagement::produceCek(const JweHeader& header,
                                           const CryptoContext& ctx) const {
  auto cek = content_crypto::generateCek(header.encryptionMethod(), ctx);
  auto wrapped = aes_kw::wrap(kek_, cek, ctx);
  return CekResult{std::move(cek), Base64Url::encode(wrapped), header};
}

SecretBytes AesKeyWrapManagement::recoverCek(
    const JweHeader& header, const std::optional<Base64Url>& encrypted_key,
    const CryptoContext& ctx) const {
  const auto& ek = key_management::requireEncryptedKey(encrypted_key);
  return checkedCek(aes_kw::unwrap(kek_, ek.decode(), ctx),
                    header.encryptionMethod());
}

//
// AES-GCM key wrap
//

AesGcmKeyWrapManagement::AesGcmKeyWrapManagement(SecretBytes kek)
    : alg_(algorithmForKek(key_management::aesGcmKeyWrapFor(kek.size()),
                           kek.size(), "AES-GCM key wrap")),
      kek_(std::move(kek)) {}

AesGcmKeyWrapManagement::AesGcmKeyWrapManagement(JweAlgorithm alg,
                                                 SecretBytes kek)
    : alg_(alg), kek_(std::move(kek)) {
  checkKekMatches(alg_, algorithms::AES_GCM_KW,
                  key_management::aesGcmKeyWrapFor(kek_.size()));
}

CekResult AesGcmKeyWrapManagement::produceCek(const JweHeader& header,
                                              const CryptoContext& ctx) const {
  auto cek = content_crypto::generateCek(header.encryptionMethod(), ctx);
  auto iv = ctx.randomBytes(crypto_constants::GCM_IV_SIZE);

  // RFC 7518 section 4.7: the wrap has no additional authenticated data
  auto wrapped = aes_gcm::encrypt(kek_, iv, cek, {}, ctx);

  auto derived = JweHeader::Builder(header)
                     .iv(Base64Url::encode(iv))
                     .authTag(Base64Url::encode(wrapped.authTag))
                     .build();
  return CekResult{std::move(cek), Base64Url::encode(wrapped.cipherText),
                   std::move(derived)};
}

SecretBytes AesGcmKeyWrapManagement::recoverCek(
    const JweHeader& header, const std::optional<Base64Url>& encrypted_key,
    const CryptoContext& ctx) const {
  auto iv = header.iv();
  if (!iv) {
    throw MalformedInputError("missing \"iv\" header parameter for " +
                              std::string(name(alg_)));
  }
  auto tag = header.authTag();
  if (!tag) {
    throw MalformedInputError("missing \"tag\" header parameter for " +
                              std::string(name(alg_)));
  }
  const auto& ek = key_management::requireEncryptedKey(encrypted_key);

  auto plain = aes_gcm::decrypt(kek_, iv->decode(), ek.decode(), {},
                                tag->decode(), ctx);
  SecretBytes cek(plain.begin(), plain.end());
  SecureAllocator<uint8_t>::wipe(plain.data(), plain.size());
  return checkedCek(std::move(cek), header.encryptionMethod());
}

}  // namespace jose
