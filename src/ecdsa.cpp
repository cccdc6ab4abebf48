#include "jose/ecdsa.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/err.h>

#include "jose/error.hpp"
#include "openssl_util.hpp"

namespace jose {
namespace ecdsa {

namespace {

using EcdsaSigWrapper = OpenSSLWrapper<ECDSA_SIG, ECDSA_SIG_free>;

}  // namespace

JwsAlgorithm resolveAlgorithm(Curve curve) noexcept {
  switch (curve) {
    case Curve::P256:
      return JwsAlgorithm::ES256;
    case Curve::P384:
      return JwsAlgorithm::ES384;
    case Curve::P521:
      break;
  }
  return JwsAlgorithm::ES512;
}

Curve resolveCurve(JwsAlgorithm alg) {
  switch (alg) {
    case JwsAlgorithm::ES256:
      return Curve::P256;
    case JwsAlgorithm::ES384:
      return Curve::P384;
    case JwsAlgorithm::ES512:
      return Curve::P521;
    default:
      throw UnsupportedAlgorithmError(
          unsupportedJwsAlgorithm(name(alg), algorithms::ECDSA));
  }
}

size_t signatureByteArrayLength(JwsAlgorithm alg) {
  return curveInfo(resolveCurve(alg)).coordinateSize * 2;
}

std::vector<uint8_t> transcodeSignatureToConcat(std::span<const uint8_t> der,
                                                size_t output_length) {
  const unsigned char* p = der.data();
  EcdsaSigWrapper sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
  if (!sig.get() || p != der.data() + der.size()) {
    ERR_clear_error();
    throw CryptoError("Invalid DER ECDSA signature");
  }

  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(sig.get(), &r, &s);

  const int half = static_cast<int>(output_length / 2);
  std::vector<uint8_t> out(output_length);
  if (output_length % 2 != 0 || BN_bn2binpad(r, out.data(), half) != half ||
      BN_bn2binpad(s, out.data() + half, half) != half) {
    throw CryptoError("ECDSA signature does not fit " +
                      std::to_string(output_length) + " bytes");
  }
  return out;
}

std::vector<uint8_t> transcodeSignatureToDer(std::span<const uint8_t> concat) {
  if (concat.empty() || concat.size() % 2 != 0) {
    throw CryptoError("Invalid R || S ECDSA signature length");
  }
  const int half = static_cast<int>(concat.size() / 2);

  BignumWrapper r(BN_bin2bn(concat.data(), half, nullptr));
  BignumWrapper s(BN_bin2bn(concat.data() + half, half, nullptr));
  EcdsaSigWrapper sig(ECDSA_SIG_new());
  if (!r.get() || !s.get() || !sig.get()) {
    throwOsError("ECDSA_SIG_new", ENOMEM);
  }
  // ECDSA_SIG_set0 takes ownership of r and s
  if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    throw CryptoError("Failed to build ECDSA signature");
  }
  r.release();
  s.release();

  unsigned char* der = nullptr;
  int len = i2d_ECDSA_SIG(sig.get(), &der);
  if (len <= 0) {
    throw CryptoError("Failed to encode ECDSA signature");
  }
  std::vector<uint8_t> out(der, der + len);
  OPENSSL_free(der);
  return out;
}

}  // namespace ecdsa
}  // namespace jose
