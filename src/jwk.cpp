/**
 * @file jwk.cpp
 * @brief EC and RSA key handling over OpenSSL 3 EVP_PKEY
 */

#include "jose/jwk.hpp"

#include <openssl/bio.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/x509.h>

#include <array>

#include "jose/base64.hpp"
#include "jose/crypto.hpp"
#include "jose/error.hpp"
#include "jose/logging.hpp"
#include "openssl_util.hpp"

using json = nlohmann::json;

namespace jose {

namespace {

using EcGroupWrapper = OpenSSLWrapper<EC_GROUP, EC_GROUP_free>;

constexpr std::array<CurveInfo, 3> kCurves = {{
    {"P-256", "prime256v1", NID_X9_62_prime256v1, 32},
    {"P-384", "secp384r1", NID_secp384r1, 48},
    {"P-521", "secp521r1", NID_secp521r1, 66},
}};

std::shared_ptr<EVP_PKEY> share(EVP_PKEY* key) {
  return std::shared_ptr<EVP_PKEY>(key, EVP_PKEY_free);
}

template <typename Out>
Out bioContents(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  return Out(data, data + len);
}

std::vector<uint8_t> publicDer(EVP_PKEY* key) {
  auto bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!bio || !i2d_PUBKEY_bio(bio.get(), key)) {
    throw CryptoError("Failed to serialize public key");
  }
  return bioContents<std::vector<uint8_t>>(bio.get());
}

SecretBytes privateDer(EVP_PKEY* key, bool has_private) {
  if (!has_private) throw InvalidKeyError("key has no private part");
  auto bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!bio || !i2d_PrivateKey_bio(bio.get(), key)) {
    throw CryptoError("Failed to serialize private key");
  }
  auto der = bioContents<SecretBytes>(bio.get());
  char* data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  SecureAllocator<uint8_t>::wipe(data, static_cast<size_t>(len));
  return der;
}

EVP_PKEY* readPrivateDer(std::span<const uint8_t> der) {
  auto bio = BioPtr(BIO_new_mem_buf(der.data(), static_cast<int>(der.size())));
  EVP_PKEY* key = bio ? d2i_PrivateKey_bio(bio.get(), nullptr) : nullptr;
  if (!key) {
    ERR_clear_error();
    throw InvalidKeyError("failed to load private key");
  }
  return key;
}

EVP_PKEY* readPublicDer(std::span<const uint8_t> der) {
  auto bio = BioPtr(BIO_new_mem_buf(der.data(), static_cast<int>(der.size())));
  EVP_PKEY* key = bio ? d2i_PUBKEY_bio(bio.get(), nullptr) : nullptr;
  if (!key) {
    ERR_clear_error();
    throw InvalidKeyError("failed to load public key");
  }
  return key;
}

std::vector<uint8_t> bnParam(EVP_PKEY* key, const char* param,
                             size_t pad_to = 0) {
  BIGNUM* raw = nullptr;
  if (!EVP_PKEY_get_bn_param(key, param, &raw)) {
    throw CryptoError(std::string("Failed to read key parameter ") + param);
  }
  BignumWrapper bn(raw);
  size_t len = pad_to ? pad_to : static_cast<size_t>(BN_num_bytes(bn.get()));
  std::vector<uint8_t> out(len);
  if (BN_bn2binpad(bn.get(), out.data(), static_cast<int>(len)) !=
      static_cast<int>(len)) {
    throw CryptoError(std::string("Failed to encode key parameter ") + param);
  }
  return out;
}

std::vector<uint8_t> jwkMember(const nlohmann::ordered_json& jwk,
                               const char* member) {
  auto it = jwk.find(member);
  if (it == jwk.end() || !it->is_string()) {
    throw InvalidKeyError(std::string("JWK is missing \"") + member + "\"");
  }
  try {
    return base64UrlDecode(it->get<std::string>());
  } catch (const InvalidBase64Error&) {
    throw InvalidKeyError(std::string("JWK \"") + member +
                          "\" is not base64url");
  }
}

void requireKeyType(const nlohmann::ordered_json& jwk, std::string_view kty) {
  auto it = jwk.find("kty");
  if (it == jwk.end() || !it->is_string() || it->get<std::string>() != kty) {
    throw InvalidKeyError("JWK kty must be " + std::string(kty));
  }
}

// RFC 7638: required members only, lexicographic order, no whitespace.
// nlohmann::json (not ordered_json) keeps object keys sorted.
std::string thumbprintOf(const json& canonical, const CryptoContext& ctx) {
  auto text = canonical.dump();
  auto hash = digest::compute(
      "SHA256",
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()),
                               text.size()),
      ctx);
  return base64UrlEncode(hash);
}

Curve curveOf(EVP_PKEY* key) {
  char group[64] = {};
  size_t len = 0;
  if (!EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME, group,
                                      sizeof(group), &len)) {
    throw InvalidKeyError("EC key has no named curve");
  }
  int nid = OBJ_txt2nid(group);
  for (size_t i = 0; i < kCurves.size(); ++i) {
    if (kCurves[i].nid == nid) return static_cast<Curve>(i);
  }
  throw InvalidKeyError("unsupported EC curve " + std::string(group));
}

}  // namespace

const CurveInfo& curveInfo(Curve curve) {
  return kCurves[static_cast<size_t>(curve)];
}

std::optional<Curve> curveFromName(std::string_view jwk_name) {
  for (size_t i = 0; i < kCurves.size(); ++i) {
    if (kCurves[i].jwkName == jwk_name) return static_cast<Curve>(i);
  }
  return std::nullopt;
}

bool isPointOnCurve(Curve curve, std::span<const uint8_t> x,
                    std::span<const uint8_t> y, const CryptoContext& ctx) {
  const auto& info = curveInfo(curve);
  if (x.size() != info.coordinateSize || y.size() != info.coordinateSize) {
    return false;
  }

  EcGroupWrapper group(EC_GROUP_new_by_curve_name_ex(
      ctx.libraryContext(), ctx.propertyQuery(), info.nid));
  BnCtxWrapper bn_ctx(BN_CTX_new_ex(ctx.libraryContext()));
  BignumWrapper p(BN_new()), a(BN_new()), b(BN_new());
  if (!group.get() || !bn_ctx.get() || !p.get() || !a.get() || !b.get() ||
      !EC_GROUP_get_curve(group.get(), p.get(), a.get(), b.get(),
                          bn_ctx.get())) {
    throw CryptoError("Failed to load curve parameters");
  }

  BignumWrapper bx(BN_bin2bn(x.data(), static_cast<int>(x.size()), nullptr));
  BignumWrapper by(BN_bin2bn(y.data(), static_cast<int>(y.size()), nullptr));
  BignumWrapper lhs(BN_new()), rhs(BN_new()), tmp(BN_new());
  if (!bx.get() || !by.get() || !lhs.get() || !rhs.get() || !tmp.get()) {
    throwOsError("BN_new", ENOMEM);
  }
  if (BN_cmp(bx.get(), p.get()) >= 0 || BN_cmp(by.get(), p.get()) >= 0) {
    return false;
  }

  // lhs = y^2, rhs = x^3 + a*x + b, all mod p
  bool ok = BN_mod_sqr(lhs.get(), by.get(), p.get(), bn_ctx.get()) &&
            BN_mod_sqr(tmp.get(), bx.get(), p.get(), bn_ctx.get()) &&
            BN_mod_mul(rhs.get(), tmp.get(), bx.get(), p.get(), bn_ctx.get()) &&
            BN_mod_mul(tmp.get(), a.get(), bx.get(), p.get(), bn_ctx.get()) &&
            BN_mod_add(rhs.get(), rhs.get(), tmp.get(), p.get(),
                       bn_ctx.get()) &&
            BN_mod_add(rhs.get(), rhs.get(), b.get(), p.get(), bn_ctx.get());
  if (!ok) throw CryptoError("Curve equation evaluation failed");
  return BN_cmp(lhs.get(), rhs.get()) == 0;
}

//
// EcKey
//

EcKey EcKey::adopt(EVP_PKEY* key, bool has_private) {
  auto shared = share(key);
  if (!EVP_PKEY_is_a(key, "EC")) {
    throw InvalidKeyError("not an EC key");
  }
  return EcKey(shared, curveOf(key), has_private);
}

EcKey EcKey::generate(Curve curve, const CryptoContext& ctx) {
  JOSE_LOG_DEBUG("Generating EC key on {}", curveInfo(curve).jwkName);
  EvpPkeyCtxWrapper pctx(EVP_PKEY_CTX_new_from_name(
      ctx.libraryContext(), "EC", ctx.propertyQuery()));
  if (!pctx.get()) {
    throw CryptoError("Failed to create EC key context");
  }
  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize EC key generation");
  }
  if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(),
                                             curveInfo(curve).nid) <= 0) {
    throw CryptoError("Failed to set EC curve");
  }
  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    throw CryptoError("Failed to generate EC key pair");
  }
  return EcKey(share(pkey), curve, true);
}

EcKey EcKey::fromCoordinates(Curve curve, std::span<const uint8_t> x,
                             std::span<const uint8_t> y,
                             const CryptoContext& ctx) {
  if (!isPointOnCurve(curve, x, y, ctx)) {
    throw InvalidKeyError("point is not on " +
                          std::string(curveInfo(curve).jwkName));
  }

  // Uncompressed SEC1 point
  std::vector<uint8_t> point;
  point.reserve(1 + x.size() + y.size());
  point.push_back(0x04);
  point.insert(point.end(), x.begin(), x.end());
  point.insert(point.end(), y.begin(), y.end());

  ParamBldWrapper bld(OSSL_PARAM_BLD_new());
  std::string group(curveInfo(curve).groupName);
  if (!bld.get() ||
      !OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                       group.c_str(), 0) ||
      !OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                        point.data(), point.size())) {
    throw CryptoError("Failed to build EC key parameters");
  }
  ParamWrapper params(OSSL_PARAM_BLD_to_param(bld.get()));

  EvpPkeyCtxWrapper pctx(EVP_PKEY_CTX_new_from_name(
      ctx.libraryContext(), "EC", ctx.propertyQuery()));
  EVP_PKEY* pkey = nullptr;
  if (!params.get() || !pctx.get() ||
      EVP_PKEY_fromdata_init(pctx.get()) <= 0 ||
      EVP_PKEY_fromdata(pctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY,
                        params.get()) <= 0) {
    ERR_clear_error();
    throw InvalidKeyError("failed to import EC public key");
  }
  return EcKey(share(pkey), curve, false);
}

EcKey EcKey::fromPublicJwk(const nlohmann::ordered_json& jwk,
                           const CryptoContext& ctx) {
  requireKeyType(jwk, "EC");
  auto crv = jwk.find("crv");
  if (crv == jwk.end() || !crv->is_string()) {
    throw InvalidKeyError("JWK is missing \"crv\"");
  }
  auto curve = curveFromName(crv->get<std::string>());
  if (!curve) {
    throw InvalidKeyError("unsupported curve " + crv->get<std::string>());
  }
  return fromCoordinates(*curve, jwkMember(jwk, "x"), jwkMember(jwk, "y"),
                         ctx);
}

EcKey EcKey::fromPrivateKeyDer(std::span<const uint8_t> der) {
  return adopt(readPrivateDer(der), true);
}

EcKey EcKey::fromPublicKeyDer(std::span<const uint8_t> der) {
  return adopt(readPublicDer(der), false);
}

std::vector<uint8_t> EcKey::x() const {
  return bnParam(key_.get(), OSSL_PKEY_PARAM_EC_PUB_X,
                 curveInfo(curve_).coordinateSize);
}

std::vector<uint8_t> EcKey::y() const {
  return bnParam(key_.get(), OSSL_PKEY_PARAM_EC_PUB_Y,
                 curveInfo(curve_).coordinateSize);
}

EcKey EcKey::publicKey() const {
  if (!has_private_) return *this;
  return fromPublicKeyDer(publicKeyDer());
}

SecretBytes EcKey::privateKeyDer() const {
  return privateDer(key_.get(), has_private_);
}

std::vector<uint8_t> EcKey::publicKeyDer() const {
  return publicDer(key_.get());
}

nlohmann::ordered_json EcKey::toPublicJwk() const {
  return {{"kty", "EC"},
          {"crv", std::string(curveInfo(curve_).jwkName)},
          {"x", base64UrlEncode(x())},
          {"y", base64UrlEncode(y())}};
}

std::string EcKey::thumbprint(const CryptoContext& ctx) const {
  json canonical = {{"crv", std::string(curveInfo(curve_).jwkName)},
                    {"kty", "EC"},
                    {"x", base64UrlEncode(x())},
                    {"y", base64UrlEncode(y())}};
  return thumbprintOf(canonical, ctx);
}

//
// RsaKey
//

RsaKey RsaKey::adopt(EVP_PKEY* key, bool has_private) {
  auto shared = share(key);
  if (!EVP_PKEY_is_a(key, "RSA") && !EVP_PKEY_is_a(key, "RSA-PSS")) {
    throw InvalidKeyError("not an RSA key");
  }
  return RsaKey(shared, has_private);
}

RsaKey RsaKey::generate(unsigned int bits, const CryptoContext& ctx) {
  JOSE_LOG_DEBUG("Generating {}-bit RSA key", bits);
  EvpPkeyCtxWrapper pctx(EVP_PKEY_CTX_new_from_name(
      ctx.libraryContext(), "RSA", ctx.propertyQuery()));
  if (!pctx.get()) {
    throw CryptoError("Failed to create RSA key context");
  }
  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize RSA key generation");
  }
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx.get(), static_cast<int>(bits)) <=
      0) {
    throw CryptoError("Failed to set RSA key size");
  }
  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    throw CryptoError("Failed to generate RSA key pair");
  }
  return RsaKey(share(pkey), true);
}

RsaKey RsaKey::fromPrivateKeyDer(std::span<const uint8_t> der) {
  return adopt(readPrivateDer(der), true);
}

RsaKey RsaKey::fromPublicKeyDer(std::span<const uint8_t> der) {
  return adopt(readPublicDer(der), false);
}

RsaKey RsaKey::fromPublicJwk(const nlohmann::ordered_json& jwk,
                             const CryptoContext& ctx) {
  requireKeyType(jwk, "RSA");
  auto n_bytes = jwkMember(jwk, "n");
  auto e_bytes = jwkMember(jwk, "e");
  if (n_bytes.empty() || e_bytes.empty()) {
    throw InvalidKeyError("RSA JWK has an empty modulus or exponent");
  }

  BignumWrapper n(
      BN_bin2bn(n_bytes.data(), static_cast<int>(n_bytes.size()), nullptr));
  BignumWrapper e(
      BN_bin2bn(e_bytes.data(), static_cast<int>(e_bytes.size()), nullptr));
  ParamBldWrapper bld(OSSL_PARAM_BLD_new());
  if (!n.get() || !e.get() || !bld.get() ||
      !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) ||
      !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get())) {
    throw CryptoError("Failed to build RSA key parameters");
  }
  ParamWrapper params(OSSL_PARAM_BLD_to_param(bld.get()));

  EvpPkeyCtxWrapper pctx(EVP_PKEY_CTX_new_from_name(
      ctx.libraryContext(), "RSA", ctx.propertyQuery()));
  EVP_PKEY* pkey = nullptr;
  if (!params.get() || !pctx.get() ||
      EVP_PKEY_fromdata_init(pctx.get()) <= 0 ||
      EVP_PKEY_fromdata(pctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY,
                        params.get()) <= 0) {
    ERR_clear_error();
    throw InvalidKeyError("failed to import RSA public key");
  }
  return RsaKey(share(pkey), false);
}

size_t RsaKey::modulusBits() const { return rsa::modulusBits(key_.get()); }

RsaKey RsaKey::publicKey() const {
  if (!has_private_) return *this;
  return fromPublicKeyDer(publicKeyDer());
}

SecretBytes RsaKey::privateKeyDer() const {
  return privateDer(key_.get(), has_private_);
}

std::vector<uint8_t> RsaKey::publicKeyDer() const {
  return publicDer(key_.get());
}

nlohmann::ordered_json RsaKey::toPublicJwk() const {
  return {{"kty", "RSA"},
          {"n", base64UrlEncode(bnParam(key_.get(), OSSL_PKEY_PARAM_RSA_N))},
          {"e", base64UrlEncode(bnParam(key_.get(), OSSL_PKEY_PARAM_RSA_E))}};
}

std::string RsaKey::thumbprint(const CryptoContext& ctx) const {
  json canonical = {
      {"e", base64UrlEncode(bnParam(key_.get(), OSSL_PKEY_PARAM_RSA_E))},
      {"kty", "RSA"},
      {"n", base64UrlEncode(bnParam(key_.get(), OSSL_PKEY_PARAM_RSA_N))}};
  return thumbprintOf(canonical, ctx);
}

}  // namespace jose
