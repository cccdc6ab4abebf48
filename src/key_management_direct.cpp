#include <string>

#include "jose/content_crypto.hpp"
#include "jose/error.hpp"
#include "jose/key_management.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace {

void checkKeyFits(const SecretBytes& key, EncryptionMethod enc) {
  if (key.size() != cekByteLength(enc)) {
    throw KeyLengthError("the key length for " + std::string(name(enc)) +
                         " must be " + std::to_string(cekByteLength(enc) * 8) +
                         " bits");
  }
}

}  // namespace

DirectKeyManagement::DirectKeyManagement(SecretBytes key)
    : key_(std::move(key)) {
  switch (key_.size() * 8) {
    case 128:
    case 192:
    case 256:
    case 384:
    case 512:
      break;
    default:
      throw KeyLengthError(
          "the direct key must be 128, 192, 256, 384 or 512 bits, got " +
          std::to_string(key_.size() * 8));
  }
}

std::span<const JweAlgorithm> DirectKeyManagement::supportedAlgorithms()
    const noexcept {
  return algorithms::DIRECT;
}

std::vector<EncryptionMethod> DirectKeyManagement::compatibleEncryptionMethods()
    const {
  return content_crypto::compatibleEncryptionMethods(key_.size() * 8);
}

CekResult DirectKeyManagement::produceCek(const JweHeader& header,
                                          const CryptoContext&) const {
  checkKeyFits(key_, header.encryptionMethod());
  return CekResult{key_, std::nullopt, header};
}

SecretBytes DirectKeyManagement::recoverCek(
    const JweHeader& header, const std::optional<Base64Url>& encrypted_key,
    const CryptoContext&) const {
  key_management::rejectEncryptedKey(encrypted_key);
  checkKeyFits(key_, header.encryptionMethod());
  return key_;
}

}  // namespace jose
