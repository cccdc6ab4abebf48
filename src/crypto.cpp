#include "jose/crypto.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rsa.h>

#include <string>

#include "jose/logging.hpp"
#include "openssl_util.hpp"

namespace jose {

void EvpKeyDeleter::operator()(EVP_PKEY* key) const noexcept {
  if (key) EVP_PKEY_free(key);
}

void BioDeleter::operator()(BIO* bio) const noexcept {
  if (bio) BIO_free(bio);
}

namespace {

using EvpCipherWrapper = OpenSSLWrapper<EVP_CIPHER, EVP_CIPHER_free>;
using EvpCipherCtxWrapper = OpenSSLWrapper<EVP_CIPHER_CTX, EVP_CIPHER_CTX_free>;
using EvpMacWrapper = OpenSSLWrapper<EVP_MAC, EVP_MAC_free>;
using EvpMacCtxWrapper = OpenSSLWrapper<EVP_MAC_CTX, EVP_MAC_CTX_free>;

EvpCipherWrapper fetchAes(size_t key_size, std::string_view mode,
                          const CryptoContext& ctx) {
  if (!crypto_constants::is_valid_aes_key_size(key_size)) {
    throw KeyLengthError("AES key must be 128, 192 or 256 bits, got " +
                         std::to_string(key_size * 8));
  }
  std::string name =
      "AES-" + std::to_string(key_size * 8) + "-" + std::string(mode);
  EvpCipherWrapper cipher(
      EVP_CIPHER_fetch(ctx.libraryContext(), name.c_str(), ctx.propertyQuery()));
  if (!cipher.get()) {
    throw CryptoError("Cipher " + name + " is not available");
  }
  return cipher;
}

EvpCipherCtxWrapper newCipherContext() {
  EvpCipherCtxWrapper cctx(EVP_CIPHER_CTX_new());
  if (!cctx.get()) {
    throwOsError("EVP_CIPHER_CTX_new", ENOMEM);
  }
  return cctx;
}

}  // namespace

//
// AES-CBC
//

namespace aes_cbc {

std::vector<uint8_t> encrypt(std::span<const uint8_t> key,
                             std::span<const uint8_t> iv,
                             std::span<const uint8_t> plaintext,
                             const CryptoContext& ctx) {
  if (iv.size() != crypto_constants::CBC_IV_SIZE) {
    throw CryptoError("Invalid IV size for AES-CBC (must be 16 bytes)");
  }
  auto cipher = fetchAes(key.size(), "CBC", ctx);
  auto cctx = newCipherContext();

  if (EVP_EncryptInit_ex2(cctx.get(), cipher.get(), key.data(), iv.data(),
                          nullptr) != 1) {
    throw CryptoError("Failed to initialize AES-CBC encryption");
  }

  std::vector<uint8_t> out(plaintext.size() + crypto_constants::AES_BLOCK_SIZE);
  int len = 0;
  if (EVP_EncryptUpdate(cctx.get(), out.data(), &len, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    throw CryptoError("Failed to encrypt data");
  }
  int total = len;
  if (EVP_EncryptFinal_ex(cctx.get(), out.data() + total, &len) != 1) {
    throw CryptoError("Failed to finalize AES-CBC encryption");
  }
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

std::vector<uint8_t> decrypt(std::span<const uint8_t> key,
                             std::span<const uint8_t> iv,
                             std::span<const uint8_t> ciphertext,
                             const CryptoContext& ctx) {
  if (iv.size() != crypto_constants::CBC_IV_SIZE) {
    throw CryptoError("Invalid IV size for AES-CBC (must be 16 bytes)");
  }
  auto cipher = fetchAes(key.size(), "CBC", ctx);
  auto cctx = newCipherContext();

  if (EVP_DecryptInit_ex2(cctx.get(), cipher.get(), key.data(), iv.data(),
                          nullptr) != 1) {
    throw CryptoError("Failed to initialize AES-CBC decryption");
  }

  std::vector<uint8_t> out(ciphertext.size() +
                           crypto_constants::AES_BLOCK_SIZE);
  int len = 0;
  if (EVP_DecryptUpdate(cctx.get(), out.data(), &len, ciphertext.data(),
                        static_cast<int>(ciphertext.size())) != 1) {
    throw CryptoError("Failed to decrypt data");
  }
  int total = len;
  if (EVP_DecryptFinal_ex(cctx.get(), out.data() + total, &len) != 1) {
    ERR_clear_error();
    throw CryptoError("AES-CBC padding check failed");
  }
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

}  // namespace aes_cbc

//
// AES-GCM
//

namespace aes_gcm {

AuthenticatedCipherText encrypt(std::span<const uint8_t> key,
                                std::span<const uint8_t> iv,
                                std::span<const uint8_t> plaintext,
                                std::span<const uint8_t> aad,
                                const CryptoContext& ctx) {
  if (iv.size() != crypto_constants::GCM_IV_SIZE) {
    throw CryptoError("Invalid IV size for AES-GCM (must be 12 bytes)");
  }
  auto cipher = fetchAes(key.size(), "GCM", ctx);
  auto cctx = newCipherContext();

  if (EVP_EncryptInit_ex2(cctx.get(), cipher.get(), key.data(), iv.data(),
                          nullptr) != 1) {
    throw CryptoError("Failed to initialize AES-GCM encryption");
  }

  int len = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(cctx.get(), nullptr, &len, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    throw CryptoError("Failed to process AES-GCM additional data");
  }

  AuthenticatedCipherText result;
  result.cipherText.resize(plaintext.size() + crypto_constants::AES_BLOCK_SIZE);
  if (EVP_EncryptUpdate(cctx.get(), result.cipherText.data(), &len,
                        plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    throw CryptoError("Failed to encrypt data");
  }
  int total = len;
  if (EVP_EncryptFinal_ex(cctx.get(), result.cipherText.data() + total,
                          &len) != 1) {
    throw CryptoError("Failed to finalize AES-GCM encryption");
  }
  total += len;
  result.cipherText.resize(static_cast<size_t>(total));

  result.authTag.resize(crypto_constants::GCM_TAG_SIZE);
  if (EVP_CIPHER_CTX_ctrl(cctx.get(), EVP_CTRL_GCM_GET_TAG,
                          crypto_constants::GCM_TAG_SIZE,
                          result.authTag.data()) != 1) {
    throw CryptoError("Failed to get AES-GCM authentication tag");
  }
  return result;
}

std::vector<uint8_t> decrypt(std::span<const uint8_t> key,
                             std::span<const uint8_t> iv,
                             std::span<const uint8_t> ciphertext,
                             std::span<const uint8_t> aad,
                             std::span<const uint8_t> tag,
                             const CryptoContext& ctx) {
  if (iv.size() != crypto_constants::GCM_IV_SIZE ||
      tag.size() != crypto_constants::GCM_TAG_SIZE) {
    JOSE_LOG_DEBUG("AES-GCM IV or tag has the wrong length");
    throw DecryptionError();
  }
  auto cipher = fetchAes(key.size(), "GCM", ctx);
  auto cctx = newCipherContext();

  if (EVP_DecryptInit_ex2(cctx.get(), cipher.get(), key.data(), iv.data(),
                          nullptr) != 1) {
    throw CryptoError("Failed to initialize AES-GCM decryption");
  }

  int len = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(cctx.get(), nullptr, &len, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    throw CryptoError("Failed to process AES-GCM additional data");
  }

  std::vector<uint8_t> out(ciphertext.size() +
                           crypto_constants::AES_BLOCK_SIZE);
  if (EVP_DecryptUpdate(cctx.get(), out.data(), &len, ciphertext.data(),
                        static_cast<int>(ciphertext.size())) != 1) {
    throw DecryptionError();
  }
  int total = len;

  // EVP_CTRL_GCM_SET_TAG takes a non-const buffer
  std::vector<uint8_t> expected(tag.begin(), tag.end());
  if (EVP_CIPHER_CTX_ctrl(cctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(expected.size()),
                          expected.data()) != 1) {
    throw CryptoError("Failed to set AES-GCM authentication tag");
  }

  if (EVP_DecryptFinal_ex(cctx.get(), out.data() + total, &len) != 1) {
    ERR_clear_error();
    JOSE_LOG_DEBUG("AES-GCM authentication tag mismatch");
    throw DecryptionError();
  }
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

}  // namespace aes_gcm

//
// AES key wrap (RFC 3394)
//

namespace aes_kw {

std::vector<uint8_t> wrap(std::span<const uint8_t> kek,
                          std::span<const uint8_t> key,
                          const CryptoContext& ctx) {
  if (key.size() < 16 || key.size() % 8 != 0) {
    throw CryptoError("Key to wrap must be a multiple of 64 bits, at least 128");
  }
  auto cipher = fetchAes(kek.size(), "WRAP", ctx);
  auto cctx = newCipherContext();
  EVP_CIPHER_CTX_set_flags(cctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);

  if (EVP_EncryptInit_ex2(cctx.get(), cipher.get(), kek.data(), nullptr,
                          nullptr) != 1) {
    throw CryptoError("Failed to initialize AES key wrap");
  }

  std::vector<uint8_t> out(key.size() + crypto_constants::KW_OVERHEAD);
  int len = 0;
  if (EVP_EncryptUpdate(cctx.get(), out.data(), &len, key.data(),
                        static_cast<int>(key.size())) != 1) {
    throw CryptoError("AES key wrap failed");
  }
  int total = len;
  if (EVP_EncryptFinal_ex(cctx.get(), out.data() + total, &len) != 1) {
    throw CryptoError("Failed to finalize AES key wrap");
  }
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

SecretBytes unwrap(std::span<const uint8_t> kek,
                   std::span<const uint8_t> wrapped,
                   const CryptoContext& ctx) {
  if (wrapped.size() < 24 || wrapped.size() % 8 != 0) {
    JOSE_LOG_DEBUG("Wrapped key has an invalid length of {} bytes",
                   wrapped.size());
    throw DecryptionError();
  }
  auto cipher = fetchAes(kek.size(), "WRAP", ctx);
  auto cctx = newCipherContext();
  EVP_CIPHER_CTX_set_flags(cctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);

  if (EVP_DecryptInit_ex2(cctx.get(), cipher.get(), kek.data(), nullptr,
                          nullptr) != 1) {
    throw CryptoError("Failed to initialize AES key unwrap");
  }

  SecretBytes out(wrapped.size() + crypto_constants::KW_OVERHEAD);
  int len = 0;
  if (EVP_DecryptUpdate(cctx.get(), out.data(), &len, wrapped.data(),
                        static_cast<int>(wrapped.size())) != 1) {
    ERR_clear_error();
    JOSE_LOG_DEBUG("AES key unwrap integrity check failed");
    throw DecryptionError();
  }
  int total = len;
  if (EVP_DecryptFinal_ex(cctx.get(), out.data() + total, &len) != 1) {
    ERR_clear_error();
    throw DecryptionError();
  }
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

}  // namespace aes_kw

//
// RSA encryption
//

namespace rsa {

namespace {

void configurePadding(EVP_PKEY_CTX* pctx, Padding padding,
                      const CryptoContext& ctx) {
  if (padding == Padding::PKCS1_V1_5) {
    if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) <= 0) {
      throw CryptoError("Failed to set PKCS#1 v1.5 padding");
    }
    return;
  }

  const char* md = padding == Padding::OAEP_SHA256 ? "SHA256" : "SHA1";
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_OAEP_PADDING) <= 0) {
    throw CryptoError("Failed to set OAEP padding");
  }
  if (EVP_PKEY_CTX_set_rsa_oaep_md_name(pctx, md, ctx.propertyQuery()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_mgf1_md_name(pctx, md, ctx.propertyQuery()) <= 0) {
    throw CryptoError("Failed to set OAEP digest");
  }
}

}  // namespace

std::vector<uint8_t> encrypt(EVP_PKEY* public_key, Padding padding,
                             std::span<const uint8_t> plaintext,
                             const CryptoContext& ctx) {
  EvpPkeyCtxWrapper pctx(EVP_PKEY_CTX_new_from_pkey(
      ctx.libraryContext(), public_key, ctx.propertyQuery()));
  if (!pctx.get()) throw CryptoError("Failed to create RSA context");

  if (EVP_PKEY_encrypt_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize RSA encryption");
  }
  configurePadding(pctx.get(), padding, ctx);

  size_t out_len = 0;
  if (EVP_PKEY_encrypt(pctx.get(), nullptr, &out_len, plaintext.data(),
                       plaintext.size()) <= 0) {
    throw CryptoError("Failed to determine RSA ciphertext length");
  }
  std::vector<uint8_t> out(out_len);
  if (EVP_PKEY_encrypt(pctx.get(), out.data(), &out_len, plaintext.data(),
                       plaintext.size()) <= 0) {
    throw CryptoError("RSA encryption failed");
  }
  out.resize(out_len);
  return out;
}

SecretBytes decrypt(EVP_PKEY* private_key, Padding padding,
                    std::span<const uint8_t> ciphertext,
                    const CryptoContext& ctx) {
  EvpPkeyCtxWrapper pctx(EVP_PKEY_CTX_new_from_pkey(
      ctx.libraryContext(), private_key, ctx.propertyQuery()));
  if (!pctx.get()) throw CryptoError("Failed to create RSA context");

  if (EVP_PKEY_decrypt_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize RSA decryption");
  }
  configurePadding(pctx.get(), padding, ctx);

  size_t out_len = 0;
  if (EVP_PKEY_decrypt(pctx.get(), nullptr, &out_len, ciphertext.data(),
                       ciphertext.size()) <= 0) {
    ERR_clear_error();
    throw CryptoError("Failed to determine RSA plaintext length");
  }
  SecretBytes out(out_len);
  if (EVP_PKEY_decrypt(pctx.get(), out.data(), &out_len, ciphertext.data(),
                       ciphertext.size()) <= 0) {
    ERR_clear_error();
    throw CryptoError("RSA decryption failed");
  }
  out.resize(out_len);
  return out;
}

size_t modulusBits(EVP_PKEY* key) {
  int bits = EVP_PKEY_get_bits(key);
  if (bits <= 0) throw InvalidKeyError("cannot determine RSA modulus size");
  return static_cast<size_t>(bits);
}

}  // namespace rsa

//
// ECDH
//

namespace ecdh {

SecretBytes deriveSharedSecret(EVP_PKEY* private_key, EVP_PKEY* peer_key,
                               const CryptoContext& ctx) {
  EvpPkeyCtxWrapper pctx(EVP_PKEY_CTX_new_from_pkey(
      ctx.libraryContext(), private_key, ctx.propertyQuery()));
  if (!pctx.get()) throw CryptoError("Failed to create ECDH context");

  if (EVP_PKEY_derive_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize ECDH key agreement");
  }
  if (EVP_PKEY_derive_set_peer(pctx.get(), peer_key) <= 0) {
    throw CryptoError("Failed to set ECDH peer key");
  }

  size_t secret_len = 0;
  if (EVP_PKEY_derive(pctx.get(), nullptr, &secret_len) <= 0) {
    throw CryptoError("Failed to determine ECDH shared secret length");
  }
  SecretBytes secret(secret_len);
  if (EVP_PKEY_derive(pctx.get(), secret.data(), &secret_len) <= 0) {
    throw CryptoError("ECDH key agreement failed");
  }
  secret.resize(secret_len);
  return secret;
}

}  // namespace ecdh

//
// Digests and HMAC
//

namespace digest {

size_t size(std::string_view digest_name, const CryptoContext& ctx) {
  auto md = fetchDigest(digest_name, ctx);
  return static_cast<size_t>(EVP_MD_get_size(md.get()));
}

std::vector<uint8_t> compute(std::string_view digest_name,
                             std::span<const uint8_t> data,
                             const CryptoContext& ctx) {
  auto md = fetchDigest(digest_name, ctx);
  std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, md.get(),
                 nullptr) != 1) {
    throw CryptoError("Digest computation failed");
  }
  out.resize(len);
  return out;
}

}  // namespace digest

namespace hmac {

std::vector<uint8_t> compute(std::string_view digest_name,
                             std::span<const uint8_t> key,
                             std::span<const uint8_t> data,
                             const CryptoContext& ctx) {
  EvpMacWrapper mac(
      EVP_MAC_fetch(ctx.libraryContext(), "HMAC", ctx.propertyQuery()));
  if (!mac.get()) throw CryptoError("HMAC is not available");

  EvpMacCtxWrapper mctx(EVP_MAC_CTX_new(mac.get()));
  if (!mctx.get()) throw CryptoError("Failed to create HMAC context");

  std::string md(digest_name);
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, md.data(), 0),
      OSSL_PARAM_construct_end()};

  if (EVP_MAC_init(mctx.get(), key.data(), key.size(), params) != 1) {
    throw CryptoError("Failed to initialize HMAC");
  }
  if (EVP_MAC_update(mctx.get(), data.data(), data.size()) != 1) {
    throw CryptoError("Failed to update HMAC");
  }

  // Secure buffer for the intermediate result, the returned MAC is public
  SecretBytes result(EVP_MAX_MD_SIZE);
  size_t len = 0;
  if (EVP_MAC_final(mctx.get(), result.data(), &len, result.size()) != 1) {
    throw CryptoError("HMAC computation failed");
  }
  return std::vector<uint8_t>(result.begin(), result.begin() + len);
}

}  // namespace hmac

//
// PBKDF2
//

namespace pbkdf2 {

SecretBytes deriveKey(std::span<const uint8_t> password,
                      std::span<const uint8_t> salt, uint32_t iterations,
                      std::string_view digest_name, size_t key_length,
                      const CryptoContext& ctx) {
  auto kctx = newKdfContext("PBKDF2", ctx);

  std::string md(digest_name);
  unsigned int iter = iterations;
  int pkcs5 = 1;  // disables the SP 800-132 lower-bound checks
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_octet_string(
          OSSL_KDF_PARAM_PASSWORD, const_cast<uint8_t*>(password.data()),
          password.size()),
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                        const_cast<uint8_t*>(salt.data()),
                                        salt.size()),
      OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iter),
      OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, md.data(), 0),
      OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5),
      OSSL_PARAM_construct_end()};

  SecretBytes key(key_length);
  if (EVP_KDF_derive(kctx.get(), key.data(), key.size(), params) != 1) {
    throw CryptoError("PBKDF2 key derivation failed");
  }
  return key;
}

}  // namespace pbkdf2

}  // namespace jose
