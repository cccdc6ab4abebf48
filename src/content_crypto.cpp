#include "jose/content_crypto.hpp"

#include <string>

#include "jose/compression.hpp"
#include "jose/error.hpp"
#include "jose/kdf.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace {

std::span<const uint8_t> asBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

std::optional<std::vector<uint8_t>> decodeOptional(
    const std::optional<Base64Url>& value) {
  if (!value) return std::nullopt;
  return value->decode();
}

std::string legacyMacInput(const JweHeader& header,
                           const std::optional<Base64Url>& encrypted_key,
                           const Base64Url& iv, const Base64Url& cipher_text) {
  std::string input = header.toBase64Url().str();
  input += '.';
  if (encrypted_key) input += encrypted_key->str();
  input += '.';
  input += iv.str();
  input += '.';
  input += cipher_text.str();
  return input;
}

void checkCekLength(EncryptionMethod enc, std::span<const uint8_t> cek) {
  if (cek.size() != cekByteLength(enc)) {
    throw KeyLengthError("the CEK length for " + std::string(name(enc)) +
                         " must be " + std::to_string(cekByteLength(enc) * 8) +
                         " bits, got " + std::to_string(cek.size() * 8));
  }
}

}  // namespace

//
// AAD
//

namespace aad {

std::vector<uint8_t> compute(const Header& header) {
  return compute(header.toBase64Url());
}

std::vector<uint8_t> compute(const Base64Url& encoded_header) {
  const auto& text = encoded_header.str();
  return {text.begin(), text.end()};
}

std::array<uint8_t, 8> computeLength(std::span<const uint8_t> aad) {
  uint64_t bits = static_cast<uint64_t>(aad.size()) * 8;
  std::array<uint8_t, 8> out{};
  for (size_t i = 0; i < out.size(); ++i) {
    out[7 - i] = static_cast<uint8_t>(bits >> (8 * i));
  }
  return out;
}

}  // namespace aad

//
// AES_CBC_HMAC_SHA2
//

namespace cbc_hmac {

namespace {

std::vector<uint8_t> macOf(const CompositeKey& key,
                           std::span<const uint8_t> aad,
                           std::span<const uint8_t> iv,
                           std::span<const uint8_t> ciphertext,
                           const CryptoContext& ctx) {
  auto al = aad::computeLength(aad);
  std::vector<uint8_t> input;
  input.reserve(aad.size() + iv.size() + ciphertext.size() + al.size());
  input.insert(input.end(), aad.begin(), aad.end());
  input.insert(input.end(), iv.begin(), iv.end());
  input.insert(input.end(), ciphertext.begin(), ciphertext.end());
  input.insert(input.end(), al.begin(), al.end());

  auto mac = hmac::compute(key.digest, key.macKey, input, ctx);
  mac.resize(key.truncatedMacLength);
  return mac;
}

}  // namespace

CompositeKey splitKey(std::span<const uint8_t> cek) {
  std::string_view digest;
  switch (cek.size()) {
    case 32:
      digest = "SHA256";
      break;
    case 48:
      digest = "SHA384";
      break;
    case 64:
      digest = "SHA512";
      break;
    default:
      throw KeyLengthError(
          "AES/CBC/HMAC composite key must be 256, 384 or 512 bits");
  }
  const size_t half = cek.size() / 2;
  return CompositeKey{SecretBytes(cek.begin(), cek.begin() + half),
                      SecretBytes(cek.begin() + half, cek.end()), half,
                      digest};
}

AuthenticatedCipherText encryptAuthenticated(std::span<const uint8_t> cek,
                                             std::span<const uint8_t> iv,
                                             std::span<const uint8_t> plaintext,
                                             std::span<const uint8_t> aad,
                                             const CryptoContext& ctx) {
  auto key = splitKey(cek);
  AuthenticatedCipherText result;
  result.cipherText = aes_cbc::encrypt(key.encKey, iv, plaintext, ctx);
  result.authTag = macOf(key, aad, iv, result.cipherText, ctx);
  return result;
}

std::vector<uint8_t> decryptAuthenticated(std::span<const uint8_t> cek,
                                          std::span<const uint8_t> iv,
                                          std::span<const uint8_t> ciphertext,
                                          std::span<const uint8_t> aad,
                                          std::span<const uint8_t> tag,
                                          const CryptoContext& ctx) {
  auto key = splitKey(cek);
  auto expected = macOf(key, aad, iv, ciphertext, ctx);
  bool tag_ok = secure_utils::constantTimeEqual(expected, tag);

  // Decrypt regardless of the tag so both failures take the same path
  std::vector<uint8_t> plaintext;
  bool padding_ok = true;
  try {
    plaintext = aes_cbc::decrypt(key.encKey, iv, ciphertext, ctx);
  } catch (const CryptoError&) {
    padding_ok = false;
  }

  if (!tag_ok || !padding_ok) {
    JOSE_LOG_DEBUG("AES/CBC/HMAC decryption failed (tag {}, padding {})",
                   tag_ok ? "ok" : "mismatch", padding_ok ? "ok" : "invalid");
    throw DecryptionError();
  }
  return plaintext;
}

}  // namespace cbc_hmac

//
// Legacy A128CBC+HS256 / A256CBC+HS512
//

namespace legacy_cbc_hmac {

AuthenticatedCipherText encrypt(const JweHeader& header,
                                std::span<const uint8_t> cmk,
                                const std::optional<Base64Url>& encrypted_key,
                                std::span<const uint8_t> iv,
                                std::span<const uint8_t> plaintext,
                                const CryptoContext& ctx) {
  const auto enc = header.encryptionMethod();
  auto epu = decodeOptional(header.encryptionPartyUInfo());
  auto epv = decodeOptional(header.encryptionPartyVInfo());

  auto cek = legacy_kdf::generateCek(cmk, enc, epu, epv, ctx);
  AuthenticatedCipherText result;
  result.cipherText = aes_cbc::encrypt(cek, iv, plaintext, ctx);

  auto cik = legacy_kdf::generateCik(cmk, enc, epu, epv, ctx);
  auto mac_input = legacyMacInput(header, encrypted_key, Base64Url::encode(iv),
                                  Base64Url::encode(result.cipherText));
  result.authTag = hmac::compute(methodInfo(enc).digest, cik,
                                 asBytes(mac_input), ctx);
  return result;
}

std::vector<uint8_t> decrypt(const JweHeader& header,
                             std::span<const uint8_t> cmk,
                             const std::optional<Base64Url>& encrypted_key,
                             const Base64Url& iv, const Base64Url& cipher_text,
                             const Base64Url& auth_tag,
                             const CryptoContext& ctx) {
  const auto enc = header.encryptionMethod();
  auto epu = decodeOptional(header.encryptionPartyUInfo());
  auto epv = decodeOptional(header.encryptionPartyVInfo());

  auto cek = legacy_kdf::generateCek(cmk, enc, epu, epv, ctx);
  std::vector<uint8_t> plaintext;
  bool padding_ok = true;
  try {
    plaintext = aes_cbc::decrypt(cek, iv.decode(), cipher_text.decode(), ctx);
  } catch (const CryptoError&) {
    padding_ok = false;
  }

  auto cik = legacy_kdf::generateCik(cmk, enc, epu, epv, ctx);
  auto mac_input = legacyMacInput(header, encrypted_key, iv, cipher_text);
  auto expected =
      hmac::compute(methodInfo(enc).digest, cik, asBytes(mac_input), ctx);
  bool tag_ok = secure_utils::constantTimeEqual(expected, auth_tag.decode());

  if (!tag_ok || !padding_ok) {
    JOSE_LOG_DEBUG("Legacy CBC/HMAC decryption failed (tag {}, padding {})",
                   tag_ok ? "ok" : "mismatch", padding_ok ? "ok" : "invalid");
    throw DecryptionError();
  }
  return plaintext;
}

}  // namespace legacy_cbc_hmac

//
// Dispatcher
//

namespace content_crypto {

std::span<const EncryptionMethod> supportedEncryptionMethods() noexcept {
  return algorithms::ALL_ENC;
}

std::vector<EncryptionMethod> compatibleEncryptionMethods(
    size_t key_bit_length) {
  std::vector<EncryptionMethod> methods;
  for (auto enc : algorithms::ALL_ENC) {
    if (methodInfo(enc).cekBitLength == key_bit_length) methods.push_back(enc);
  }
  return methods;
}

SecretBytes generateCek(EncryptionMethod enc, const CryptoContext& ctx) {
  return ctx.randomSecret(cekByteLength(enc));
}

JweCryptoParts encrypt(const JweHeader& header,
                       std::span<const uint8_t> plaintext,
                       std::span<const uint8_t> cek,
                       std::optional<Base64Url> encrypted_key,
                       const CryptoContext& ctx) {
  const auto enc = header.encryptionMethod();
  checkCekLength(enc, cek);

  auto content = compression::compress(header, plaintext);
  auto aad_bytes = aad::compute(header);

  std::vector<uint8_t> iv;
  AuthenticatedCipherText encrypted;
  switch (methodInfo(enc).family) {
    case ContentFamily::AES_CBC_HMAC:
      iv = ctx.randomBytes(crypto_constants::CBC_IV_SIZE);
      encrypted =
          cbc_hmac::encryptAuthenticated(cek, iv, content, aad_bytes, ctx);
      break;
    case ContentFamily::AES_GCM:
      iv = ctx.randomBytes(crypto_constants::GCM_IV_SIZE);
      encrypted = aes_gcm::encrypt(cek, iv, content, aad_bytes, ctx);
      break;
    case ContentFamily::AES_CBC_HMAC_LEGACY:
      iv = ctx.randomBytes(crypto_constants::CBC_IV_SIZE);
      encrypted = legacy_cbc_hmac::encrypt(header, cek, encrypted_key, iv,
                                           content, ctx);
      break;
    default:
      throw UnsupportedAlgorithmError(unsupportedEncryptionMethod(
          name(enc), supportedEncryptionMethods()));
  }

  JOSE_LOG_DEBUG("Encrypted {} bytes with {}", plaintext.size(), name(enc));
  return JweCryptoParts{header, std::move(encrypted_key), Base64Url::encode(iv),
                        Base64Url::encode(encrypted.cipherText),
                        Base64Url::encode(encrypted.authTag)};
}

std::vector<uint8_t> decrypt(const JweHeader& header,
                             const std::optional<Base64Url>& encrypted_key,
                             const Base64Url& iv, const Base64Url& cipher_text,
                             const Base64Url& auth_tag,
                             std::span<const uint8_t> cek,
                             const CryptoContext& ctx) {
  const auto enc = header.encryptionMethod();
  checkCekLength(enc, cek);

  auto aad_bytes = aad::compute(header);

  std::vector<uint8_t> content;
  switch (methodInfo(enc).family) {
    case ContentFamily::AES_CBC_HMAC:
      content = cbc_hmac::decryptAuthenticated(
          cek, iv.decode(), cipher_text.decode(), aad_bytes, auth_tag.decode(),
          ctx);
      break;
    case ContentFamily::AES_GCM:
      content = aes_gcm::decrypt(cek, iv.decode(), cipher_text.decode(),
                                 aad_bytes, auth_tag.decode(), ctx);
      break;
    case ContentFamily::AES_CBC_HMAC_LEGACY:
      content = legacy_cbc_hmac::decrypt(header, cek, encrypted_key, iv,
                                         cipher_text, auth_tag, ctx);
      break;
    default:
      throw UnsupportedAlgorithmError(unsupportedEncryptionMethod(
          name(enc), supportedEncryptionMethods()));
  }

  try {
    return compression::decompress(header, content);
  } catch (const CryptoError& e) {
    JOSE_LOG_DEBUG("Decompression failed: {}", e.what());
    throw DecryptionError();
  }
}

}  // namespace content_crypto
}  // namespace jose
