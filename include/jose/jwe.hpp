/**
 * @file jwe.hpp
 * @brief JWE encryption and decryption (RFC 7516) and the compact JWE object
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "content_crypto.hpp"
#include "critical_params.hpp"
#include "crypto_context.hpp"
#include "header.hpp"
#include "key_management.hpp"

namespace jose {

/**
 * @brief Encrypts plaintext for one recipient with a key management strategy
 */
class JweEncrypter {
 public:
  explicit JweEncrypter(KeyManagement key_management,
                        CryptoContext ctx = CryptoContext::defaultContext())
      : key_management_(std::move(key_management)), ctx_(std::move(ctx)) {}

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms() const {
    return key_management::supportedAlgorithms(key_management_);
  }

  [[nodiscard]] std::span<const EncryptionMethod> supportedEncryptionMethods()
      const noexcept {
    return content_crypto::supportedEncryptionMethods();
  }

  /**
   * @brief Produce the CEK, derive the final header and encrypt
   * @return Parts whose header may differ from the input header
   * @throws UnsupportedAlgorithmError if "alg" does not belong to the
   * strategy
   * @throws KeyLengthError if the key does not fit "enc"
   */
  JweCryptoParts encrypt(const JweHeader& header,
                         std::span<const uint8_t> plaintext) const;

  JweCryptoParts encrypt(const JweHeader& header,
                         std::string_view plaintext) const {
    return encrypt(header,
                   std::span<const uint8_t>(
                       reinterpret_cast<const uint8_t*>(plaintext.data()),
                       plaintext.size()));
  }

  [[nodiscard]] const CryptoContext& cryptoContext() const noexcept {
    return ctx_;
  }

 private:
  KeyManagement key_management_;
  CryptoContext ctx_;
};

/**
 * @brief Decrypts JWEs addressed to one key
 *
 * Checks run in this order: "iv" and tag present, "alg" handled by the
 * strategy, "crit" accepted by the policy, then key recovery and content
 * decryption. A rejected "crit" raises the same DecryptionError as a failed
 * authentication.
 */
class JweDecrypter {
 public:
  explicit JweDecrypter(KeyManagement key_management,
                        CriticalParamsPolicy policy = {},
                        CryptoContext ctx = CryptoContext::defaultContext())
      : key_management_(std::move(key_management)),
        policy_(std::move(policy)),
        ctx_(std::move(ctx)) {}

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms() const {
    return key_management::supportedAlgorithms(key_management_);
  }

  [[nodiscard]] std::span<const EncryptionMethod> supportedEncryptionMethods()
      const noexcept {
    return content_crypto::supportedEncryptionMethods();
  }

  [[nodiscard]] const CriticalParamsPolicy& criticalParamsPolicy()
      const noexcept {
    return policy_;
  }

  [[nodiscard]] const KeyManagement& keyManagement() const noexcept {
    return key_management_;
  }

  /**
   * @throws MalformedInputError if the IV or tag is missing
   * @throws UnsupportedAlgorithmError if "alg" does not belong to the
   * strategy
   * @throws DecryptionError on any authentication failure, including a
   * value that is not valid base64url
   */
  std::vector<uint8_t> decrypt(const JweHeader& header,
                               const std::optional<Base64Url>& encrypted_key,
                               const std::optional<Base64Url>& iv,
                               const Base64Url& cipher_text,
                               const std::optional<Base64Url>& auth_tag) const;

 private:
  KeyManagement key_management_;
  CriticalParamsPolicy policy_;
  CryptoContext ctx_;
};

/**
 * @brief JWE with its lifecycle: UNENCRYPTED, then ENCRYPTED, then
 * DECRYPTED
 *
 * A JWE built from a header and payload starts UNENCRYPTED; one parsed from
 * its compact form starts ENCRYPTED.
 */
class JweObject {
 public:
  enum class State { UNENCRYPTED, ENCRYPTED, DECRYPTED };

  JweObject(JweHeader header, std::vector<uint8_t> payload);
  JweObject(JweHeader header, std::string_view payload);

  /**
   * @brief Parse "header.encryptedKey.iv.ciphertext.tag"
   * @throws MalformedInputError unless there are exactly five parts, each
   * after the header valid base64url
   * @throws ParseError, InvalidBase64Error or UnsupportedAlgorithmError for a
   * bad header
   */
  static JweObject parse(std::string_view compact);

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] const JweHeader& header() const noexcept { return header_; }
  [[nodiscard]] const std::optional<Base64Url>& encryptedKey() const noexcept {
    return encrypted_key_;
  }
  [[nodiscard]] const std::optional<Base64Url>& iv() const noexcept {
    return iv_;
  }
  [[nodiscard]] const Base64Url& cipherText() const noexcept {
    return cipher_text_;
  }
  [[nodiscard]] const std::optional<Base64Url>& authTag() const noexcept {
    return auth_tag_;
  }

  /// @throws InvalidStateError while ENCRYPTED
  [[nodiscard]] const std::vector<uint8_t>& payload() const;
  [[nodiscard]] std::string payloadAsString() const;

  /// @throws InvalidStateError unless UNENCRYPTED
  void encrypt(const JweEncrypter& encrypter);

  /// @throws InvalidStateError unless ENCRYPTED
  void decrypt(const JweDecrypter& decrypter);

  /// @throws InvalidStateError while UNENCRYPTED
  [[nodiscard]] std::string serialize() const;

 private:
  JweObject(JweHeader header, std::optional<Base64Url> encrypted_key,
            std::optional<Base64Url> iv, Base64Url cipher_text,
            std::optional<Base64Url> auth_tag);

  JweHeader header_;
  std::optional<Base64Url> encrypted_key_;
  std::optional<Base64Url> iv_;
  Base64Url cipher_text_;
  std::optional<Base64Url> auth_tag_;
  std::vector<uint8_t> payload_;
  State state_;
};

}  // namespace jose
