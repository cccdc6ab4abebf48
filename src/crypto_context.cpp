#include "jose/crypto_context.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include "jose/error.hpp"
#include "jose/logging.hpp"

namespace jose {

void CryptoContext::randomBytes(std::span<uint8_t> out) const {
  if (out.empty()) return;
  if (RAND_bytes_ex(library_context_, out.data(), out.size(), 0) != 1) {
    JOSE_LOG_ERROR("Failed to generate {} random bytes", out.size());
    unsigned long err = ERR_get_error();
    if (err == 0) {
      throwOsError("RAND_bytes_ex");
    }
    throw CryptoError("Failed to generate random bytes: OpenSSL error " +
                      std::to_string(err));
  }
}

std::vector<uint8_t> CryptoContext::randomBytes(size_t count) const {
  std::vector<uint8_t> bytes(count);
  randomBytes(std::span<uint8_t>(bytes));
  return bytes;
}

SecretBytes CryptoContext::randomSecret(size_t count) const {
  SecretBytes bytes(count);
  randomBytes(std::span<uint8_t>(bytes.data(), bytes.size()));
  return bytes;
}

const CryptoContext& CryptoContext::defaultContext() noexcept {
  static const CryptoContext instance;
  return instance;
}

}  // namespace jose
