#include "jose/kdf.hpp"

#include <openssl/core_names.h>

#include <string>

#include "jose/error.hpp"
#include "openssl_util.hpp"

namespace jose {
namespace concat_kdf {

SecretBytes deriveKey(std::span<const uint8_t> shared_secret,
                      size_t key_bit_length,
                      std::span<const uint8_t> other_info,
                      std::string_view digest_name, const CryptoContext& ctx) {
  if (shared_secret.empty() || key_bit_length == 0 || key_bit_length % 8 != 0) {
    throw CryptoError("Invalid Concat KDF input");
  }

  // OpenSSL's single-step KDF with a digest is the SP 800-56A concatenation
  // KDF: H(counter || Z || OtherInfo) for counter = 1, 2, ...
  auto kctx = newKdfContext("SSKDF", ctx);

  std::string md(digest_name);
  OSSL_PARAM params[4];
  size_t n = 0;
  params[n++] =
      OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, md.data(), 0);
  params[n++] = OSSL_PARAM_construct_octet_string(
      OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(shared_secret.data()),
      shared_secret.size());
  if (!other_info.empty()) {
    params[n++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(other_info.data()),
        other_info.size());
  }
  params[n] = OSSL_PARAM_construct_end();

  SecretBytes key(key_bit_length / 8);
  if (EVP_KDF_derive(kctx.get(), key.data(), key.size(), params) != 1) {
    throw CryptoError("Concat KDF key derivation failed");
  }
  return key;
}

size_t computeDigestCycles(size_t digest_bits, size_t key_bits) noexcept {
  return (key_bits + digest_bits - 1) / digest_bits;
}

std::vector<uint8_t> composeOtherInfo(std::span<const uint8_t> algorithm_id,
                                      std::span<const uint8_t> party_u_info,
                                      std::span<const uint8_t> party_v_info,
                                      std::span<const uint8_t> supp_pub_info,
                                      std::span<const uint8_t> supp_priv_info) {
  std::vector<uint8_t> out;
  out.reserve(algorithm_id.size() + party_u_info.size() +
              party_v_info.size() + supp_pub_info.size() +
              supp_priv_info.size());
  for (auto part : {algorithm_id, party_u_info, party_v_info, supp_pub_info,
                    supp_priv_info}) {
    out.insert(out.end(), part.begin(), part.end());
  }
  return out;
}

std::vector<uint8_t> encodeNoData() { return {}; }

std::vector<uint8_t> encodeIntData(uint32_t value) {
  return {static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
          static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
}

std::vector<uint8_t> encodeStringData(std::string_view value) {
  return encodeDataWithLength(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t*>(value.data()), value.size()));
}

std::vector<uint8_t> encodeDataWithLength(std::span<const uint8_t> data) {
  auto out = encodeIntData(static_cast<uint32_t>(data.size()));
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

}  // namespace concat_kdf

namespace legacy_kdf {

namespace {

std::vector<uint8_t> partyInfo(const std::optional<std::vector<uint8_t>>& info) {
  if (!info) return concat_kdf::encodeIntData(0);
  return concat_kdf::encodeDataWithLength(*info);
}

// keydatalen || enc || epu || epv || label
std::vector<uint8_t> otherInfo(size_t key_bits, EncryptionMethod enc,
                               const std::optional<std::vector<uint8_t>>& epu,
                               const std::optional<std::vector<uint8_t>>& epv,
                               std::string_view label) {
  auto out = concat_kdf::encodeIntData(static_cast<uint32_t>(key_bits));
  auto enc_name = name(enc);
  out.insert(out.end(), enc_name.begin(), enc_name.end());
  auto u = partyInfo(epu);
  out.insert(out.end(), u.begin(), u.end());
  auto v = partyInfo(epv);
  out.insert(out.end(), v.begin(), v.end());
  out.insert(out.end(), label.begin(), label.end());
  return out;
}

std::string_view digestFor(std::span<const uint8_t> cmk) {
  switch (cmk.size() * 8) {
    case 256:
      return "SHA256";
    case 512:
      return "SHA512";
    default:
      throw KeyLengthError("content master key must be 256 or 512 bits");
  }
}

}  // namespace

SecretBytes generateCek(std::span<const uint8_t> cmk, EncryptionMethod enc,
                        const std::optional<std::vector<uint8_t>>& epu,
                        const std::optional<std::vector<uint8_t>>& epv,
                        const CryptoContext& ctx) {
  const auto digest_name = digestFor(cmk);
  const size_t cek_bits = cmk.size() * 8 / 2;
  auto info = otherInfo(cek_bits, enc, epu, epv, "Encryption");
  return concat_kdf::deriveKey(cmk, cek_bits, info, digest_name, ctx);
}

SecretBytes generateCik(std::span<const uint8_t> cmk, EncryptionMethod enc,
                        const std::optional<std::vector<uint8_t>>& epu,
                        const std::optional<std::vector<uint8_t>>& epv,
                        const CryptoContext& ctx) {
  const auto digest_name = digestFor(cmk);
  const size_t cik_bits = cmk.size() * 8;
  auto info = otherInfo(cik_bits, enc, epu, epv, "Integrity");
  return concat_kdf::deriveKey(cmk, cik_bits, info, digest_name, ctx);
}

}  // namespace legacy_kdf
}  // namespace jose
