/**
 * @file jwk.hpp
 * @brief EC and RSA keys with JSON Web Key (RFC 7517) import/export and
 * RFC 7638 thumbprints
 *
 * Keys wrap an OpenSSL EVP_PKEY. They are immutable once created, so copies
 * share the underlying handle and may be used from several threads.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "crypto_context.hpp"
#include "secure_vector.hpp"

typedef struct evp_pkey_st EVP_PKEY;

namespace jose {

enum class Curve { P256, P384, P521 };

struct CurveInfo {
  std::string_view jwkName;    ///< "crv" value
  std::string_view groupName;  ///< OpenSSL group name
  int nid;
  size_t coordinateSize;  ///< bytes per affine coordinate
};

const CurveInfo& curveInfo(Curve curve);

/// Curve for a JWK "crv" name such as "P-256"
std::optional<Curve> curveFromName(std::string_view jwk_name);

/**
 * @brief Check y^2 = x^3 + ax + b (mod p) for an affine point
 *
 * Coordinates must be exactly the curve's coordinate size and less than p.
 */
bool isPointOnCurve(Curve curve, std::span<const uint8_t> x,
                    std::span<const uint8_t> y,
                    const CryptoContext& ctx = CryptoContext::defaultContext());

/**
 * @brief Elliptic curve key on P-256, P-384 or P-521
 */
class EcKey {
 public:
  static EcKey generate(
      Curve curve, const CryptoContext& ctx = CryptoContext::defaultContext());

  /**
   * @brief Public key from affine coordinates
   * @throws InvalidKeyError if the point is not on the curve
   */
  static EcKey fromCoordinates(
      Curve curve, std::span<const uint8_t> x, std::span<const uint8_t> y,
      const CryptoContext& ctx = CryptoContext::defaultContext());

  /**
   * @brief Public key from a JWK object with "kty": "EC"
   * @throws InvalidKeyError for a wrong kty, unknown crv or invalid point
   */
  static EcKey fromPublicJwk(
      const nlohmann::ordered_json& jwk,
      const CryptoContext& ctx = CryptoContext::defaultContext());

  /// PKCS#8 or SEC1 DER private key
  static EcKey fromPrivateKeyDer(std::span<const uint8_t> der);

  /// SubjectPublicKeyInfo DER
  static EcKey fromPublicKeyDer(std::span<const uint8_t> der);

  [[nodiscard]] Curve curve() const noexcept { return curve_; }
  [[nodiscard]] bool hasPrivateKey() const noexcept { return has_private_; }
  [[nodiscard]] EVP_PKEY* get() const noexcept { return key_.get(); }

  [[nodiscard]] std::vector<uint8_t> x() const;
  [[nodiscard]] std::vector<uint8_t> y() const;

  /// The same key without its private part
  [[nodiscard]] EcKey publicKey() const;

  [[nodiscard]] SecretBytes privateKeyDer() const;
  [[nodiscard]] std::vector<uint8_t> publicKeyDer() const;

  /// {"kty","crv","x","y"}
  [[nodiscard]] nlohmann::ordered_json toPublicJwk() const;

  /// Base64url SHA-256 thumbprint (RFC 7638)
  [[nodiscard]] std::string thumbprint(
      const CryptoContext& ctx = CryptoContext::defaultContext()) const;

 private:
  EcKey(std::shared_ptr<EVP_PKEY> key, Curve curve, bool has_private)
      : key_(std::move(key)), curve_(curve), has_private_(has_private) {}

  static EcKey adopt(EVP_PKEY* key, bool has_private);

  std::shared_ptr<EVP_PKEY> key_;
  Curve curve_;
  bool has_private_;
};

/**
 * @brief RSA key pair or public key
 */
class RsaKey {
 public:
  static RsaKey generate(
      unsigned int bits = 2048,
      const CryptoContext& ctx = CryptoContext::defaultContext());

  static RsaKey fromPrivateKeyDer(std::span<const uint8_t> der);
  static RsaKey fromPublicKeyDer(std::span<const uint8_t> der);

  /**
   * @brief Public key from a JWK object with "kty": "RSA"
   * @throws InvalidKeyError if "n" or "e" is missing or malformed
   */
  static RsaKey fromPublicJwk(
      const nlohmann::ordered_json& jwk,
      const CryptoContext& ctx = CryptoContext::defaultContext());

  [[nodiscard]] bool hasPrivateKey() const noexcept { return has_private_; }
  [[nodiscard]] EVP_PKEY* get() const noexcept { return key_.get(); }
  [[nodiscard]] size_t modulusBits() const;

  [[nodiscard]] RsaKey publicKey() const;

  [[nodiscard]] SecretBytes privateKeyDer() const;
  [[nodiscard]] std::vector<uint8_t> publicKeyDer() const;

  /// {"kty","n","e"}
  [[nodiscard]] nlohmann::ordered_json toPublicJwk() const;

  [[nodiscard]] std::string thumbprint(
      const CryptoContext& ctx = CryptoContext::defaultContext()) const;

 private:
  RsaKey(std::shared_ptr<EVP_PKEY> key, bool has_private)
      : key_(std::move(key)), has_private_(has_private) {}

  static RsaKey adopt(EVP_PKEY* key, bool has_private);

  std::shared_ptr<EVP_PKEY> key_;
  bool has_private_;
};

}  // namespace jose
