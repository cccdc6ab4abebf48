#include "jose/algorithm.hpp"

#include <array>
#include <utility>

#include "jose/error.hpp"

namespace jose {

namespace {

constexpr std::array<std::pair<JweAlgorithm, std::string_view>, 17>
    jwe_algorithm_names = {{
        {JweAlgorithm::RSA1_5, "RSA1_5"},
        {JweAlgorithm::RSA_OAEP, "RSA-OAEP"},
        {JweAlgorithm::RSA_OAEP_256, "RSA-OAEP-256"},
        {JweAlgorithm::A128KW, "A128KW"},
        {JweAlgorithm::A192KW, "A192KW"},
        {JweAlgorithm::A256KW, "A256KW"},
        {JweAlgorithm::DIR, "dir"},
        {JweAlgorithm::ECDH_ES, "ECDH-ES"},
        {JweAlgorithm::ECDH_ES_A128KW, "ECDH-ES+A128KW"},
        {JweAlgorithm::ECDH_ES_A192KW, "ECDH-ES+A192KW"},
        {JweAlgorithm::ECDH_ES_A256KW, "ECDH-ES+A256KW"},
        {JweAlgorithm::A128GCMKW, "A128GCMKW"},
        {JweAlgorithm::A192GCMKW, "A192GCMKW"},
        {JweAlgorithm::A256GCMKW, "A256GCMKW"},
        {JweAlgorithm::PBES2_HS256_A128KW, "PBES2-HS256+A128KW"},
        {JweAlgorithm::PBES2_HS384_A192KW, "PBES2-HS384+A192KW"},
        {JweAlgorithm::PBES2_HS512_A256KW, "PBES2-HS512+A256KW"},
    }};

// name, CEK bits, family, MAC key bytes, ENC key bytes, tag bytes, digest
constexpr std::array<std::pair<EncryptionMethod, EncryptionMethodInfo>, 8>
    method_table = {{
        {EncryptionMethod::A128CBC_HS256,
         {"A128CBC-HS256", 256, ContentFamily::AES_CBC_HMAC, 16, 16, 16,
          "SHA256"}},
        {EncryptionMethod::A192CBC_HS384,
         {"A192CBC-HS384", 384, ContentFamily::AES_CBC_HMAC, 24, 24, 24,
          "SHA384"}},
        {EncryptionMethod::A256CBC_HS512,
         {"A256CBC-HS512", 512, ContentFamily::AES_CBC_HMAC, 32, 32, 32,
          "SHA512"}},
        {EncryptionMethod::A128GCM,
         {"A128GCM", 128, ContentFamily::AES_GCM, 0, 16, 16, ""}},
        {EncryptionMethod::A192GCM,
         {"A192GCM", 192, ContentFamily::AES_GCM, 0, 24, 16, ""}},
        {EncryptionMethod::A256GCM,
         {"A256GCM", 256, ContentFamily::AES_GCM, 0, 32, 16, ""}},
        {EncryptionMethod::A128CBC_HS256_LEGACY,
         {"A128CBC+HS256", 256, ContentFamily::AES_CBC_HMAC_LEGACY, 32, 16,
          32, "SHA256"}},
        {EncryptionMethod::A256CBC_HS512_LEGACY,
         {"A256CBC+HS512", 512, ContentFamily::AES_CBC_HMAC_LEGACY, 64, 32,
          64, "SHA512"}},
    }};

constexpr std::array<std::pair<JwsAlgorithm, std::string_view>, 12>
    jws_algorithm_names = {{
        {JwsAlgorithm::HS256, "HS256"},
        {JwsAlgorithm::HS384, "HS384"},
        {JwsAlgorithm::HS512, "HS512"},
        {JwsAlgorithm::RS256, "RS256"},
        {JwsAlgorithm::RS384, "RS384"},
        {JwsAlgorithm::RS512, "RS512"},
        {JwsAlgorithm::PS256, "PS256"},
        {JwsAlgorithm::PS384, "PS384"},
        {JwsAlgorithm::PS512, "PS512"},
        {JwsAlgorithm::ES256, "ES256"},
        {JwsAlgorithm::ES384, "ES384"},
        {JwsAlgorithm::ES512, "ES512"},
    }};

template <typename E, size_t N>
std::string_view lookupName(
    const std::array<std::pair<E, std::string_view>, N>& table, E value) {
  for (const auto& [key, text] : table) {
    if (key == value) return text;
  }
  return "unknown";
}

template <typename E, size_t N>
std::optional<E> lookupValue(
    const std::array<std::pair<E, std::string_view>, N>& table,
    std::string_view text) {
  for (const auto& [key, candidate] : table) {
    if (candidate == text) return key;
  }
  return std::nullopt;
}

}  // namespace

const EncryptionMethodInfo& methodInfo(EncryptionMethod enc) {
  for (const auto& [key, info] : method_table) {
    if (key == enc) return info;
  }
  throw UnsupportedAlgorithmError(
      unsupportedEncryptionMethod("unknown", algorithms::ALL_ENC));
}

std::string_view name(JweAlgorithm alg) noexcept {
  return lookupName(jwe_algorithm_names, alg);
}

std::string_view name(EncryptionMethod enc) noexcept {
  for (const auto& [key, info] : method_table) {
    if (key == enc) return info.name;
  }
  return "unknown";
}

std::string_view name(JwsAlgorithm alg) noexcept {
  return lookupName(jws_algorithm_names, alg);
}

std::string_view name(CompressionAlgorithm) noexcept { return "DEF"; }

std::optional<JweAlgorithm> jweAlgorithmFromName(std::string_view value) {
  return lookupValue(jwe_algorithm_names, value);
}

std::optional<EncryptionMethod> encryptionMethodFromName(
    std::string_view value) {
  for (const auto& [key, info] : method_table) {
    if (info.name == value) return key;
  }
  return std::nullopt;
}

std::optional<JwsAlgorithm> jwsAlgorithmFromName(std::string_view value) {
  return lookupValue(jws_algorithm_names, value);
}

std::optional<CompressionAlgorithm> compressionFromName(
    std::string_view value) {
  if (value == "DEF") return CompressionAlgorithm::DEF;
  return std::nullopt;
}

std::string itemize(const std::vector<std::string_view>& names) {
  std::string result;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      result += (i == names.size() - 1) ? " or " : ", ";
    }
    result += names[i];
  }
  return result;
}

std::string unsupportedJweAlgorithm(std::string_view unsupported,
                                    std::span<const JweAlgorithm> supported) {
  return "Unsupported JWE algorithm " + std::string(unsupported) +
         ", must be " + itemize(supported);
}

std::string unsupportedEncryptionMethod(
    std::string_view unsupported, std::span<const EncryptionMethod> supported) {
  return "Unsupported JWE encryption method " + std::string(unsupported) +
         ", must be " + itemize(supported);
}

std::string unsupportedJwsAlgorithm(std::string_view unsupported,
                                    std::span<const JwsAlgorithm> supported) {
  return "Unsupported JWS algorithm " + std::string(unsupported) +
         ", must be " + itemize(supported);
}

}  // namespace jose
