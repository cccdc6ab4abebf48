#include "jose/key_management.hpp"

#include <string>

#include "jose/error.hpp"

namespace jose {
namespace key_management {

std::span<const JweAlgorithm> supportedAlgorithms(const KeyManagement& km) {
  return std::visit(
      [](const auto& strategy) { return strategy.supportedAlgorithms(); }, km);
}

CekResult produceCek(const KeyManagement& km, const JweHeader& header,
                     const CryptoContext& ctx) {
  return std::visit(
      [&](const auto& strategy) {
        ensureSupported(header.algorithm(), strategy.supportedAlgorithms());
        return strategy.produceCek(header, ctx);
      },
      km);
}

SecretBytes recoverCek(const KeyManagement& km, const JweHeader& header,
                       const std::optional<Base64Url>& encrypted_key,
                       const CryptoContext& ctx) {
  return std::visit(
      [&](const auto& strategy) {
        ensureSupported(header.algorithm(), strategy.supportedAlgorithms());
        return strategy.recoverCek(header, encrypted_key, ctx);
      },
      km);
}

void ensureSupported(JweAlgorithm alg,
                     std::span<const JweAlgorithm> supported) {
  for (auto candidate : supported) {
    if (candidate == alg) return;
  }
  throw UnsupportedAlgorithmError(unsupportedJweAlgorithm(name(alg), supported));
}

const Base64Url& requireEncryptedKey(
    const std::optional<Base64Url>& encrypted_key) {
  if (!encrypted_key || encrypted_key->empty()) {
    throw MalformedInputError("missing JWE encrypted key");
  }
  return *encrypted_key;
}

void rejectEncryptedKey(const std::optional<Base64Url>& encrypted_key) {
  if (encrypted_key && !encrypted_key->empty()) {
    throw MalformedInputError("unexpected JWE encrypted key");
  }
}

std::optional<JweAlgorithm> aesKeyWrapFor(size_t kek_length) {
  switch (kek_length) {
    case 16:
      return JweAlgorithm::A128KW;
    case 24:
      return JweAlgorithm::A192KW;
    case 32:
      return JweAlgorithm::A256KW;
    default:
      return std::nullopt;
  }
}

std::optional<JweAlgorithm> aesGcmKeyWrapFor(size_t kek_length) {
  switch (kek_length) {
    case 16:
      return JweAlgorithm::A128GCMKW;
    case 24:
      return JweAlgorithm::A192GCMKW;
    case 32:
      return JweAlgorithm::A256GCMKW;
    default:
      return std::nullopt;
  }
}

}  // namespace key_management
}  // namespace jose
