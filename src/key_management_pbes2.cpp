#include <string>

#include "jose/content_crypto.hpp"
#include "jose/crypto.hpp"
#include "jose/error.hpp"
#include "jose/key_management.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace pbes2 {

std::vector<uint8_t> formatSalt(JweAlgorithm alg,
                                std::span<const uint8_t> salt) {
  auto alg_name = name(alg);
  std::vector<uint8_t> out(alg_name.begin(), alg_name.end());
  out.push_back(0x00);
  out.insert(out.end(), salt.begin(), salt.end());
  return out;
}

std::string_view prfDigest(JweAlgorithm alg) {
  switch (alg) {
    case JweAlgorithm::PBES2_HS256_A128KW:
      return "SHA256";
    case JweAlgorithm::PBES2_HS384_A192KW:
      return "SHA384";
    case JweAlgorithm::PBES2_HS512_A256KW:
      return "SHA512";
    default:
      throw UnsupportedAlgorithmError(
          unsupportedJweAlgorithm(name(alg), algorithms::PBES2));
  }
}

size_t derivedKeyLength(JweAlgorithm alg) {
  switch (alg) {
    case JweAlgorithm::PBES2_HS256_A128KW:
      return 16;
    case JweAlgorithm::PBES2_HS384_A192KW:
      return 24;
    case JweAlgorithm::PBES2_HS512_A256KW:
      return 32;
    default:
      throw UnsupportedAlgorithmError(
          unsupportedJweAlgorithm(name(alg), algorithms::PBES2));
  }
}

SecretBytes deriveKey(JweAlgorithm alg, std::span<const uint8_t> password,
                      std::span<const uint8_t> salt, uint32_t iterations,
                      const CryptoContext& ctx) {
  return pbkdf2::deriveKey(password, formatSalt(alg, salt), iterations,
                           prfDigest(alg), derivedKeyLength(alg), ctx);
}

}  // namespace pbes2

PasswordKeyManagement::PasswordKeyManagement(SecretBytes password,
                                             size_t salt_length,
                                             uint32_t iterations,
                                             uint32_t max_iterations)
    : password_(std::move(password)),
      salt_length_(salt_length),
      iterations_(iterations),
      max_iterations_(max_iterations) {
  if (password_.empty()) {
    throw ConfigurationError("the password must not be empty");
  }
  if (salt_length_ < MIN_SALT_LENGTH) {
    throw ConfigurationError("the salt length must be at least " +
                             std::to_string(MIN_SALT_LENGTH) + " bytes");
  }
  if (iterations_ < MIN_ITERATIONS) {
    throw ConfigurationError("the iteration count must be at least " +
                             std::to_string(MIN_ITERATIONS));
  }
  if (max_iterations_ < iterations_) {
    throw ConfigurationError(
        "the maximum iteration count must not be below the iteration count");
  }
}

CekResult PasswordKeyManagement::produceCek(const JweHeader& header,
                                            const CryptoContext& ctx) const {
  const auto alg = header.algorithm();
  auto salt = ctx.randomBytes(salt_length_);
  auto kek = pbes2::deriveKey(alg, password_, salt, iterations_, ctx);

  auto cek = content_crypto::generateCek(header.encryptionMethod(), ctx);
  auto wrapped = aes_kw::wrap(kek, cek, ctx);

  auto derived = JweHeader::Builder(header)
                     .pbes2Salt(Base64Url::encode(salt))
                     .pbes2Count(iterations_)
                     .build();
  return CekResult{std::move(cek), Base64Url::encode(wrapped),
                   std::move(derived)};
}

SecretBytes PasswordKeyManagement::recoverCek(
    const JweHeader& header, const std::optional<Base64Url>& encrypted_key,
    const CryptoContext& ctx) const {
  auto salt = header.pbes2Salt();
  if (!salt) {
    throw MalformedInputError("missing \"p2s\" header parameter");
  }
  auto count = header.pbes2Count();
  if (!count || *count < 1) {
    throw MalformedInputError(
        "missing or invalid \"p2c\" header parameter");
  }
  if (*count > max_iterations_) {
    JOSE_LOG_DEBUG("Rejected p2c {} above the maximum {}", *count,
                   max_iterations_);
    throw MalformedInputError("the \"p2c\" header parameter exceeds " +
                              std::to_string(max_iterations_));
  }
  const auto& ek = key_management::requireEncryptedKey(encrypted_key);

  const auto enc = header.encryptionMethod();
  auto kek =
      pbes2::deriveKey(header.algorithm(), password_, salt->decode(), *count,
                       ctx);
  auto cek = aes_kw::unwrap(kek, ek.decode(), ctx);
  if (cek.size() != cekByteLength(enc)) {
    JOSE_LOG_DEBUG("Unwrapped CEK has the wrong length for {}", name(enc));
    throw DecryptionError();
  }
  return cek;
}

}  // namespace jose
