/**
 * @file key_management.hpp
 * @brief JWE key management strategies ("alg")
 *
 * A strategy turns a header into a content encryption key on the sending
 * side and recovers that key on the receiving side. Strategies that need to
 * record parameters ("iv"/"tag", "epk", "p2s"/"p2c") return a derived header;
 * the content AAD is computed from that derived header afterwards.
 *
 * The set of strategies is closed: KeyManagement is a variant over them and
 * dispatch is a std::visit. Strategies are immutable and can be shared
 * between threads.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "algorithm.hpp"
#include "base64.hpp"
#include "crypto_context.hpp"
#include "header.hpp"
#include "jwk.hpp"
#include "secure_vector.hpp"

namespace jose {

/**
 * @brief Output of the sending side of a strategy
 */
struct CekResult {
  SecretBytes cek;
  /// Absent for "dir" and "ECDH-ES"
  std::optional<Base64Url> encryptedKey;
  /// Header to authenticate; the input header when nothing was added
  JweHeader header;
};

/**
 * @brief "dir": a shared symmetric key used as the CEK
 */
class DirectKeyManagement {
 public:
  /**
   * @throws KeyLengthError unless the key is 128, 192, 256, 384 or 512 bits
   */
  explicit DirectKeyManagement(SecretBytes key);

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms()
      const noexcept;

  /// Methods whose CEK length equals the key length
  [[nodiscard]] std::vector<EncryptionMethod> compatibleEncryptionMethods()
      const;

  [[nodiscard]] const SecretBytes& key() const noexcept { return key_; }

  /// @throws KeyLengthError if the key length does not fit "enc"
  CekResult produceCek(const JweHeader& header, const CryptoContext& ctx) const;

  SecretBytes recoverCek(const JweHeader& header,
                         const std::optional<Base64Url>& encrypted_key,
                         const CryptoContext& ctx) const;

 private:
  SecretBytes key_;
};

/**
 * @brief A128KW, A192KW, A256KW: RFC 3394 wrapping of a random CEK
 */
class AesKeyWrapManagement {
 public:
  /// Variant selected by the KEK length
  explicit AesKeyWrapManagement(SecretBytes kek);

  /**
   * @throws KeyLengthError if the KEK length does not match alg
   * @throws UnsupportedAlgorithmError if alg is not an AES key wrap algorithm
   */
  AesKeyWrapManagement(JweAlgorithm alg, SecretBytes kek);

  [[nodiscard]] JweAlgorithm algorithm() const noexcept { return alg_; }

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms()
      const noexcept {
    return {&alg_, 1};
  }

  CekResult produceCek(const JweHeader& header, const CryptoContext& ctx) const;

  SecretBytes recoverCek(const JweHeader& header,
                         const std::optional<Base64Url>& encrypted_key,
                         const CryptoContext& ctx) const;

 private:
  JweAlgorithm alg_;
  SecretBytes kek_;
};

/**
 * @brief A128GCMKW, A192GCMKW, A256GCMKW: AES-GCM wrapping of a random CEK
 *
 * The wrap uses an empty AAD. Its IV and tag travel in the "iv" and "tag"
 * header parameters.
 */
class AesGcmKeyWrapManagement {
 public:
  explicit AesGcmKeyWrapManagement(SecretBytes kek);

  /**
   * @throws KeyLengthError if the KEK length does not match alg
   * @throws UnsupportedAlgorithmError if alg is not an AES-GCM key wrap
   * algorithm
   */
  AesGcmKeyWrapManagement(JweAlgorithm alg, SecretBytes kek);

  [[nodiscard]] JweAlgorithm algorithm() const noexcept { return alg_; }

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms()
      const noexcept {
    return {&alg_, 1};
  }

  CekResult produceCek(const JweHeader& header, const CryptoContext& ctx) const;

  /// @throws MalformedInputError if "iv" or "tag" is missing
  SecretBytes recoverCek(const JweHeader& header,
                         const std::optional<Base64Url>& encrypted_key,
                         const CryptoContext& ctx) const;

 private:
  JweAlgorithm alg_;
  SecretBytes kek_;
};

/**
 * @brief RSA1_5, RSA-OAEP and RSA-OAEP-256
 *
 * RSA1_5 decryption never reports a failure of its own. A random CEK of the
 * right length is drawn before the RSA operation and is returned instead of
 * the decrypted value when padding is bad or the length is wrong, so the
 * failure only shows up as a content authentication error (RFC 7516 section
 * 11.5, Bleichenbacher). OAEP failures raise DecryptionError.
 */
class RsaKeyManagement {
 public:
  explicit RsaKeyManagement(RsaKey key) : key_(std::move(key)) {}

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms()
      const noexcept {
    return algorithms::RSA;
  }

  [[nodiscard]] const RsaKey& key() const noexcept { return key_; }

  CekResult produceCek(const JweHeader& header, const CryptoContext& ctx) const;

  /// @throws InvalidKeyError if the key has no private part
  SecretBytes recoverCek(const JweHeader& header,
                         const std::optional<Base64Url>& encrypted_key,
                         const CryptoContext& ctx) const;

 private:
  RsaKey key_;
};

/**
 * @brief ECDH-ES and ECDH-ES+A128KW/+A192KW/+A256KW
 *
 * The sender generates an ephemeral key on the recipient's curve and
 * publishes it as "epk". The receiver checks that "epk" is on its own curve
 * and satisfies the curve equation before any key agreement.
 */
class EcdhKeyManagement {
 public:
  explicit EcdhKeyManagement(EcKey key) : key_(std::move(key)) {}

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms()
      const noexcept {
    return algorithms::ECDH_ES;
  }

  [[nodiscard]] const EcKey& key() const noexcept { return key_; }

  CekResult produceCek(const JweHeader& header, const CryptoContext& ctx) const;

  SecretBytes recoverCek(const JweHeader& header,
                         const std::optional<Base64Url>& encrypted_key,
                         const CryptoContext& ctx) const;

 private:
  EcKey key_;
};

/**
 * @brief PBES2-HS256+A128KW, PBES2-HS384+A192KW, PBES2-HS512+A256KW
 */
class PasswordKeyManagement {
 public:
  static constexpr size_t MIN_SALT_LENGTH = 8;
  static constexpr uint32_t MIN_ITERATIONS = 1000;
  static constexpr uint32_t DEFAULT_MAX_ITERATIONS = 1000000;

  /**
   * @param password UTF-8 password bytes
   * @param salt_length Random salt length in bytes for encryption
   * @param iterations PBKDF2 iteration count for encryption
   * @param max_iterations Largest "p2c" accepted on decryption
   * @throws ConfigurationError for an empty password, a salt shorter than 8
   * bytes, fewer than 1000 iterations or a maximum below the iteration count
   */
  explicit PasswordKeyManagement(
      SecretBytes password, size_t salt_length = MIN_SALT_LENGTH,
      uint32_t iterations = MIN_ITERATIONS,
      uint32_t max_iterations = DEFAULT_MAX_ITERATIONS);

  [[nodiscard]] std::span<const JweAlgorithm> supportedAlgorithms()
      const noexcept {
    return algorithms::PBES2;
  }

  [[nodiscard]] size_t saltLength() const noexcept { return salt_length_; }
  [[nodiscard]] uint32_t iterationCount() const noexcept { return iterations_; }
  [[nodiscard]] uint32_t maxIterationCount() const noexcept {
    return max_iterations_;
  }

  CekResult produceCek(const JweHeader& header, const CryptoContext& ctx) const;

  /**
   * @throws MalformedInputError if "p2s" or "p2c" is missing, or "p2c" is 0
   * or above the configured maximum
   */
  SecretBytes recoverCek(const JweHeader& header,
                         const std::optional<Base64Url>& encrypted_key,
                         const CryptoContext& ctx) const;

 private:
  SecretBytes password_;
  size_t salt_length_;
  uint32_t iterations_;
  uint32_t max_iterations_;
};

using KeyManagement =
    std::variant<DirectKeyManagement, AesKeyWrapManagement,
                 AesGcmKeyWrapManagement, RsaKeyManagement, EcdhKeyManagement,
                 PasswordKeyManagement>;

namespace key_management {

std::span<const JweAlgorithm> supportedAlgorithms(const KeyManagement& km);

CekResult produceCek(const KeyManagement& km, const JweHeader& header,
                     const CryptoContext& ctx);

SecretBytes recoverCek(const KeyManagement& km, const JweHeader& header,
                       const std::optional<Base64Url>& encrypted_key,
                       const CryptoContext& ctx);

/// @throws UnsupportedAlgorithmError naming the supported set
void ensureSupported(JweAlgorithm alg,
                     std::span<const JweAlgorithm> supported);

/// @throws MalformedInputError if the encrypted key is absent or empty
const Base64Url& requireEncryptedKey(
    const std::optional<Base64Url>& encrypted_key);

/// @throws MalformedInputError if an encrypted key is present
void rejectEncryptedKey(const std::optional<Base64Url>& encrypted_key);

/// Key wrap algorithm for a KEK length, nullopt for other lengths
std::optional<JweAlgorithm> aesKeyWrapFor(size_t kek_length);
std::optional<JweAlgorithm> aesGcmKeyWrapFor(size_t kek_length);

}  // namespace key_management

/**
 * @brief Key agreement details of ECDH-ES (RFC 7518 section 4.6)
 */
namespace ecdh_es {

/// Bits of the derived key: the CEK length for ECDH-ES, the KEK otherwise
size_t sharedKeyLength(JweAlgorithm alg, EncryptionMethod enc);

/**
 * @brief Concat KDF over Z with AlgorithmID, "apu", "apv" and the key
 * length taken from the header
 */
SecretBytes deriveSharedKey(const JweHeader& header,
                            std::span<const uint8_t> shared_secret,
                            const CryptoContext& ctx);

}  // namespace ecdh_es

/**
 * @brief PBES2 parameters (RFC 7518 section 4.8)
 */
namespace pbes2 {

/// UTF8(alg) || 0x00 || salt
std::vector<uint8_t> formatSalt(JweAlgorithm alg, std::span<const uint8_t> salt);

/// "SHA256", "SHA384" or "SHA512"
std::string_view prfDigest(JweAlgorithm alg);

/// 16, 24 or 32 bytes
size_t derivedKeyLength(JweAlgorithm alg);

SecretBytes deriveKey(JweAlgorithm alg, std::span<const uint8_t> password,
                      std::span<const uint8_t> salt, uint32_t iterations,
                      const CryptoContext& ctx);

}  // namespace pbes2

}  // namespace jose
