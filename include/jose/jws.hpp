/**
 * @file jws.hpp
 * @brief JWS signing and verification (RFC 7515, RFC 7518 section 3) and
 * the compact JWS object
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "algorithm.hpp"
#include "base64.hpp"
#include "critical_params.hpp"
#include "crypto.hpp"
#include "crypto_context.hpp"
#include "header.hpp"
#include "jwk.hpp"
#include "secure_vector.hpp"

namespace jose {

/**
 * @brief Base class for JWS signers
 *
 * The signing input is the ASCII text BASE64URL(header) "." BASE64URL(payload).
 */
class JwsSigner {
 public:
  virtual ~JwsSigner() = default;

  [[nodiscard]] virtual std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept = 0;

  /**
   * @brief Sign the signing input with the algorithm named by the header
   * @throws UnsupportedAlgorithmError if the signer does not handle "alg"
   */
  template <ByteData T>
  Base64Url sign(const JwsHeader& header, const T& signing_input) const {
    return signChecked(header, {std::data(signing_input),
                                std::size(signing_input)});
  }

  Base64Url sign(const JwsHeader& header,
                 std::string_view signing_input) const {
    return signChecked(
        header, {reinterpret_cast<const uint8_t*>(signing_input.data()),
                 signing_input.size()});
  }

  [[nodiscard]] const CryptoContext& cryptoContext() const noexcept {
    return ctx_;
  }

 protected:
  explicit JwsSigner(CryptoContext ctx) : ctx_(std::move(ctx)) {}

  virtual std::vector<uint8_t> signImpl(
      JwsAlgorithm alg, std::span<const uint8_t> signing_input) const = 0;

  CryptoContext ctx_;

 private:
  Base64Url signChecked(const JwsHeader& header,
                        std::span<const uint8_t> signing_input) const;
};

/**
 * @brief Base class for JWS verifiers
 *
 * An "alg" the verifier does not handle is a caller error and throws. A
 * rejected "crit", a signature that is not base64url or a signature that
 * does not verify all return false.
 */
class JwsVerifier {
 public:
  virtual ~JwsVerifier() = default;

  [[nodiscard]] virtual std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept = 0;

  /// @throws UnsupportedAlgorithmError if the verifier does not handle "alg"
  template <ByteData T>
  bool verify(const JwsHeader& header, const T& signing_input,
              const Base64Url& signature) const {
    return verifyChecked(header,
                         {std::data(signing_input), std::size(signing_input)},
                         signature);
  }

  bool verify(const JwsHeader& header, std::string_view signing_input,
              const Base64Url& signature) const {
    return verifyChecked(
        header,
        {reinterpret_cast<const uint8_t*>(signing_input.data()),
         signing_input.size()},
        signature);
  }

  [[nodiscard]] const CriticalParamsPolicy& criticalParamsPolicy()
      const noexcept {
    return policy_;
  }

 protected:
  JwsVerifier(CriticalParamsPolicy policy, CryptoContext ctx)
      : policy_(std::move(policy)), ctx_(std::move(ctx)) {}

  virtual bool verifyImpl(JwsAlgorithm alg,
                          std::span<const uint8_t> signing_input,
                          std::span<const uint8_t> signature) const = 0;

  CriticalParamsPolicy policy_;
  CryptoContext ctx_;

 private:
  bool verifyChecked(const JwsHeader& header,
                     std::span<const uint8_t> signing_input,
                     const Base64Url& signature) const;
};

/**
 * @brief HS256, HS384, HS512
 */
class MacSigner : public JwsSigner {
 public:
  static constexpr size_t MIN_SECRET_LENGTH = 32;

  /**
   * @throws KeyLengthError for a secret shorter than 256 bits
   */
  explicit MacSigner(SecretBytes secret,
                     CryptoContext ctx = CryptoContext::defaultContext());

  [[nodiscard]] std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept override {
    return algorithms::HMAC;
  }

  /// Minimum secret length in bytes for an HMAC algorithm: 32, 48 or 64
  static size_t minSecretLength(JwsAlgorithm alg);

 protected:
  /// @throws KeyLengthError if the secret is too short for alg
  std::vector<uint8_t> signImpl(
      JwsAlgorithm alg, std::span<const uint8_t> signing_input) const override;

 private:
  SecretBytes secret_;
};

class MacVerifier : public JwsVerifier {
 public:
  /// @throws KeyLengthError for a secret shorter than 256 bits
  explicit MacVerifier(SecretBytes secret, CriticalParamsPolicy policy = {},
                       CryptoContext ctx = CryptoContext::defaultContext());

  [[nodiscard]] std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept override {
    return algorithms::HMAC;
  }

 protected:
  bool verifyImpl(JwsAlgorithm alg, std::span<const uint8_t> signing_input,
                  std::span<const uint8_t> signature) const override;

 private:
  SecretBytes secret_;
};

/**
 * @brief RS256/384/512 (PKCS#1 v1.5) and PS256/384/512 (PSS, MGF1 with the
 * same hash, salt length equal to the hash length)
 */
class RsaSsaSigner : public JwsSigner {
 public:
  static constexpr size_t MIN_MODULUS_BITS = 2048;

  /**
   * @throws InvalidKeyError for a public-only key or a modulus shorter than
   * 2048 bits
   */
  explicit RsaSsaSigner(RsaKey key,
                        CryptoContext ctx = CryptoContext::defaultContext());

  [[nodiscard]] std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept override {
    return algorithms::RSASSA;
  }

 protected:
  std::vector<uint8_t> signImpl(
      JwsAlgorithm alg, std::span<const uint8_t> signing_input) const override;

 private:
  RsaKey key_;
};

class RsaSsaVerifier : public JwsVerifier {
 public:
  /// @throws InvalidKeyError for a modulus shorter than 2048 bits
  explicit RsaSsaVerifier(RsaKey key, CriticalParamsPolicy policy = {},
                          CryptoContext ctx = CryptoContext::defaultContext());

  [[nodiscard]] std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept override {
    return algorithms::RSASSA;
  }

 protected:
  bool verifyImpl(JwsAlgorithm alg, std::span<const uint8_t> signing_input,
                  std::span<const uint8_t> signature) const override;

 private:
  RsaKey key_;
};

/**
 * @brief ES256, ES384 or ES512, whichever matches the key's curve
 *
 * Signatures are the fixed-length R || S concatenation of RFC 7518 section
 * 3.4, not DER.
 */
class EcdsaSigner : public JwsSigner {
 public:
  /// @throws InvalidKeyError for a public-only key
  explicit EcdsaSigner(EcKey key,
                       CryptoContext ctx = CryptoContext::defaultContext());

  [[nodiscard]] std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept override {
    return {&alg_, 1};
  }

 protected:
  std::vector<uint8_t> signImpl(
      JwsAlgorithm alg, std::span<const uint8_t> signing_input) const override;

 private:
  EcKey key_;
  JwsAlgorithm alg_;
};

class EcdsaVerifier : public JwsVerifier {
 public:
  explicit EcdsaVerifier(EcKey key, CriticalParamsPolicy policy = {},
                         CryptoContext ctx = CryptoContext::defaultContext());

  [[nodiscard]] std::span<const JwsAlgorithm> supportedAlgorithms()
      const noexcept override {
    return {&alg_, 1};
  }

 protected:
  /// Signatures of the wrong length fail before any EC operation
  bool verifyImpl(JwsAlgorithm alg, std::span<const uint8_t> signing_input,
                  std::span<const uint8_t> signature) const override;

 private:
  EcKey key_;
  JwsAlgorithm alg_;
};

/**
 * @brief JWS with its lifecycle: UNSIGNED, then SIGNED, then VERIFIED
 */
class JwsObject {
 public:
  enum class State { UNSIGNED, SIGNED, VERIFIED };

  JwsObject(JwsHeader header, std::vector<uint8_t> payload);
  JwsObject(JwsHeader header, std::string_view payload);

  /**
   * @brief Parse "header.payload.signature"; the object starts SIGNED
   * @throws MalformedInputError unless there are exactly three parts and a
   * non-empty signature
   */
  static JwsObject parse(std::string_view compact);

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] const JwsHeader& header() const noexcept { return header_; }
  [[nodiscard]] const std::vector<uint8_t>& payload() const noexcept {
    return payload_;
  }
  [[nodiscard]] std::string payloadAsString() const {
    return std::string(payload_.begin(), payload_.end());
  }
  [[nodiscard]] const std::optional<Base64Url>& signature() const noexcept {
    return signature_;
  }

  /// BASE64URL(header) "." BASE64URL(payload)
  [[nodiscard]] std::string signingInput() const;

  /// @throws InvalidStateError unless UNSIGNED
  void sign(const JwsSigner& signer);

  /**
   * @brief Verify and move to VERIFIED on success
   * @throws InvalidStateError while UNSIGNED
   */
  bool verify(const JwsVerifier& verifier);

  /// @throws InvalidStateError while UNSIGNED
  [[nodiscard]] std::string serialize() const;

 private:
  JwsObject(JwsHeader header, Base64Url encoded_payload, Base64Url signature);

  JwsHeader header_;
  Base64Url encoded_payload_;
  std::vector<uint8_t> payload_;
  std::optional<Base64Url> signature_;
  State state_;
};

}  // namespace jose
