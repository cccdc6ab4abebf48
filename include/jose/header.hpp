/**
 * @file header.hpp
 * @brief Immutable JWS and JWE protected headers
 *
 * A header is an ordered JSON object plus its base64url encoding. A header
 * built locally is encoded once at build time; a parsed header keeps the
 * exact segment it was parsed from, so the bytes that are authenticated are
 * the bytes that were received. Deriving a new header (for example to add
 * "iv" and "tag" after AES-GCM key wrapping) goes through a Builder seeded
 * with the existing header.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "algorithm.hpp"
#include "base64.hpp"

namespace jose {

using ordered_json = nlohmann::ordered_json;

class Header {
 public:
  virtual ~Header() = default;

  [[nodiscard]] const ordered_json& toJson() const noexcept { return json_; }

  /// JSON text of the header
  [[nodiscard]] std::string toString() const { return json_.dump(); }

  /// Encoded form; for a parsed header this is the received segment
  [[nodiscard]] const Base64Url& toBase64Url() const noexcept {
    return encoded_;
  }

  [[nodiscard]] bool contains(std::string_view param) const;

  /// Raw parameter value, nullptr when absent
  [[nodiscard]] const ordered_json* param(std::string_view param) const;

  /// String parameter value; nullopt when absent or not a string
  [[nodiscard]] std::optional<std::string> stringParam(
      std::string_view param) const;

  [[nodiscard]] std::optional<std::string> type() const {
    return stringParam("typ");
  }
  [[nodiscard]] std::optional<std::string> contentType() const {
    return stringParam("cty");
  }
  [[nodiscard]] std::optional<std::string> keyId() const {
    return stringParam("kid");
  }
  [[nodiscard]] std::optional<std::string> jwkSetUrl() const {
    return stringParam("jku");
  }
  [[nodiscard]] std::optional<std::string> x509Url() const {
    return stringParam("x5u");
  }
  [[nodiscard]] std::optional<std::string> x509Thumbprint() const {
    return stringParam("x5t");
  }
  [[nodiscard]] std::vector<std::string> x509CertChain() const;

  /// Names listed in "crit", empty when the parameter is absent
  [[nodiscard]] std::set<std::string> criticalParams() const;

  /// Parameters that are not registered for this header type
  [[nodiscard]] ordered_json customParams() const;

  /// Names of all parameters present
  [[nodiscard]] std::set<std::string> includedParams() const;

 protected:
  Header(ordered_json json, Base64Url encoded)
      : json_(std::move(json)), encoded_(std::move(encoded)) {}

  /// Decode and parse a compact header segment into a JSON object
  static ordered_json decodeSegment(const Base64Url& segment);

  static void validateCritical(const ordered_json& json);

  virtual bool isRegistered(std::string_view param) const = 0;

  ordered_json json_;
  Base64Url encoded_;
};

/**
 * @brief Setters shared by the JWS and JWE builders
 *
 * Setting a parameter that is already present replaces its value in place,
 * keeping the member order of the header being derived from.
 */
template <typename Derived>
class HeaderBuilderBase {
 public:
  Derived& type(std::string value) { return set("typ", std::move(value)); }
  Derived& contentType(std::string value) {
    return set("cty", std::move(value));
  }
  Derived& keyId(std::string value) { return set("kid", std::move(value)); }
  Derived& jwkSetUrl(std::string value) {
    return set("jku", std::move(value));
  }
  Derived& x509Url(std::string value) { return set("x5u", std::move(value)); }
  Derived& x509Thumbprint(std::string value) {
    return set("x5t", std::move(value));
  }
  Derived& x509CertChain(std::vector<std::string> chain) {
    return set("x5c", std::move(chain));
  }
  Derived& criticalParams(const std::set<std::string>& names) {
    return set("crit", std::vector<std::string>(names.begin(), names.end()));
  }

  /**
   * @brief Add a parameter that is not registered for this header type
   * @throws ConfigurationError if the name is a registered parameter
   */
  Derived& customParam(const std::string& name, ordered_json value);

 protected:
  HeaderBuilderBase() = default;
  explicit HeaderBuilderBase(ordered_json json) : json_(std::move(json)) {}

  Derived& set(const std::string& name, ordered_json value) {
    json_[name] = std::move(value);
    return static_cast<Derived&>(*this);
  }

  Derived& erase(const std::string& name) {
    json_.erase(name);
    return static_cast<Derived&>(*this);
  }

  ordered_json json_ = ordered_json::object();
};

/**
 * @brief Protected header of a JWE
 */
class JweHeader : public Header {
 public:
  [[nodiscard]] JweAlgorithm algorithm() const noexcept { return alg_; }
  [[nodiscard]] EncryptionMethod encryptionMethod() const noexcept {
    return enc_;
  }
  [[nodiscard]] std::optional<CompressionAlgorithm> compression() const;

  /// "iv" of AES-GCM key wrapping
  [[nodiscard]] std::optional<Base64Url> iv() const;
  /// "tag" of AES-GCM key wrapping
  [[nodiscard]] std::optional<Base64Url> authTag() const;
  [[nodiscard]] std::optional<Base64Url> pbes2Salt() const;
  [[nodiscard]] std::optional<uint32_t> pbes2Count() const;
  [[nodiscard]] const ordered_json* ephemeralPublicKey() const {
    return param("epk");
  }
  [[nodiscard]] std::optional<Base64Url> agreementPartyUInfo() const;
  [[nodiscard]] std::optional<Base64Url> agreementPartyVInfo() const;
  /// Legacy "epu" of the A128CBC+HS256 and A256CBC+HS512 methods
  [[nodiscard]] std::optional<Base64Url> encryptionPartyUInfo() const;
  /// Legacy "epv"
  [[nodiscard]] std::optional<Base64Url> encryptionPartyVInfo() const;

  /**
   * @brief Parse a compact serialization header segment
   * @throws InvalidBase64Error, ParseError, or UnsupportedAlgorithmError for
   * unknown "alg", "enc" or "zip" values
   */
  static JweHeader parse(const Base64Url& segment);

  static JweHeader parseJson(std::string_view json_text);

  class Builder : public HeaderBuilderBase<Builder> {
   public:
    Builder(JweAlgorithm alg, EncryptionMethod enc);

    /// Start from an existing header, keeping its parameters and order
    explicit Builder(const JweHeader& header);

    Builder& compression(CompressionAlgorithm zip) {
      return set("zip", std::string(name(zip)));
    }
    Builder& iv(const Base64Url& value) { return set("iv", value.str()); }
    Builder& authTag(const Base64Url& value) {
      return set("tag", value.str());
    }
    Builder& pbes2Salt(const Base64Url& value) {
      return set("p2s", value.str());
    }
    Builder& pbes2Count(uint32_t count) { return set("p2c", count); }
    Builder& ephemeralPublicKey(ordered_json jwk) {
      return set("epk", std::move(jwk));
    }
    Builder& agreementPartyUInfo(const Base64Url& value) {
      return set("apu", value.str());
    }
    Builder& agreementPartyVInfo(const Base64Url& value) {
      return set("apv", value.str());
    }
    Builder& encryptionPartyUInfo(const Base64Url& value) {
      return set("epu", value.str());
    }
    Builder& encryptionPartyVInfo(const Base64Url& value) {
      return set("epv", value.str());
    }

    [[nodiscard]] JweHeader build() const;

    static bool isRegistered(std::string_view param);
  };

 protected:
  bool isRegistered(std::string_view param) const override {
    return Builder::isRegistered(param);
  }

 private:
  JweHeader(ordered_json json, Base64Url encoded);

  JweAlgorithm alg_;
  EncryptionMethod enc_;
};

/**
 * @brief Protected header of a JWS
 */
class JwsHeader : public Header {
 public:
  [[nodiscard]] JwsAlgorithm algorithm() const noexcept { return alg_; }

  static JwsHeader parse(const Base64Url& segment);

  static JwsHeader parseJson(std::string_view json_text);

  class Builder : public HeaderBuilderBase<Builder> {
   public:
    explicit Builder(JwsAlgorithm alg);
    explicit Builder(const JwsHeader& header);

    [[nodiscard]] JwsHeader build() const;

    static bool isRegistered(std::string_view param);
  };

 protected:
  bool isRegistered(std::string_view param) const override {
    return Builder::isRegistered(param);
  }

 private:
  JwsHeader(ordered_json json, Base64Url encoded);

  JwsAlgorithm alg_;
};

template <typename Derived>
Derived& HeaderBuilderBase<Derived>::customParam(const std::string& name,
                                                ordered_json value) {
  if (Derived::isRegistered(name)) {
    throw ConfigurationError("\"" + name +
                             "\" is a registered header parameter");
  }
  return set(name, std::move(value));
}

}  // namespace jose
