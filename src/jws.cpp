#include "jose/jws.hpp"

#include <openssl/err.h>
#include <openssl/rsa.h>

#include <string>

#include "jose/ecdsa.hpp"
#include "jose/error.hpp"
#include "jose/logging.hpp"
#include "openssl_util.hpp"

namespace jose {

namespace {

std::string_view digestFor(JwsAlgorithm alg) {
  switch (alg) {
    case JwsAlgorithm::HS256:
    case JwsAlgorithm::RS256:
    case JwsAlgorithm::PS256:
    case JwsAlgorithm::ES256:
      return "SHA256";
    case JwsAlgorithm::HS384:
    case JwsAlgorithm::RS384:
    case JwsAlgorithm::PS384:
    case JwsAlgorithm::ES384:
      return "SHA384";
    case JwsAlgorithm::HS512:
    case JwsAlgorithm::RS512:
    case JwsAlgorithm::PS512:
    case JwsAlgorithm::ES512:
      break;
  }
  return "SHA512";
}

bool isPss(JwsAlgorithm alg) noexcept {
  return alg == JwsAlgorithm::PS256 || alg == JwsAlgorithm::PS384 ||
         alg == JwsAlgorithm::PS512;
}

bool supports(std::span<const JwsAlgorithm> supported, JwsAlgorithm alg) {
  for (auto candidate : supported) {
    if (candidate == alg) return true;
  }
  return false;
}

void ensureSupported(JwsAlgorithm alg,
                     std::span<const JwsAlgorithm> supported) {
  if (!supports(supported, alg)) {
    throw UnsupportedAlgorithmError(
        unsupportedJwsAlgorithm(name(alg), supported));
  }
}

void usePssPadding(EVP_PKEY_CTX* pctx) {
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) <= 0 ||
      EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST) <= 0) {
    throw CryptoError("Failed to set PSS padding");
  }
}

std::vector<uint8_t> digestSign(EVP_PKEY* key, JwsAlgorithm alg,
                                std::span<const uint8_t> data,
                                const CryptoContext& ctx) {
  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) throw CryptoError("Failed to create signing context");

  std::string md(digestFor(alg));
  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestSignInit_ex(mdctx.get(), &pctx, md.c_str(),
                            ctx.libraryContext(), ctx.propertyQuery(), key,
                            nullptr) <= 0) {
    throw CryptoError("Failed to initialize signing");
  }
  if (isPss(alg)) usePssPadding(pctx);

  size_t sig_len = 0;
  if (EVP_DigestSign(mdctx.get(), nullptr, &sig_len, data.data(),
                     data.size()) <= 0) {
    throw CryptoError("Failed to determine signature length");
  }
  std::vector<uint8_t> signature(sig_len);
  if (EVP_DigestSign(mdctx.get(), signature.data(), &sig_len, data.data(),
                     data.size()) <= 0) {
    throw CryptoError("Failed to sign data");
  }
  signature.resize(sig_len);
  return signature;
}

bool digestVerify(EVP_PKEY* key, JwsAlgorithm alg,
                  std::span<const uint8_t> data,
                  std::span<const uint8_t> signature,
                  const CryptoContext& ctx) {
  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) return false;

  std::string md(digestFor(alg));
  EVP_PKEY_CTX* pctx = nullptr;
  if (EVP_DigestVerifyInit_ex(mdctx.get(), &pctx, md.c_str(),
                              ctx.libraryContext(), ctx.propertyQuery(), key,
                              nullptr) <= 0) {
    ERR_clear_error();
    return false;
  }
  if (isPss(alg)) usePssPadding(pctx);

  int result = EVP_DigestVerify(mdctx.get(), signature.data(),
                                signature.size(), data.data(), data.size());
  ERR_clear_error();
  return result == 1;
}

void requireRsaModulus(const RsaKey& key) {
  if (key.modulusBits() < RsaSsaSigner::MIN_MODULUS_BITS) {
    throw InvalidKeyError("RSA modulus must be at least " +
                          std::to_string(RsaSsaSigner::MIN_MODULUS_BITS) +
                          " bits");
  }
}

void requireMacSecret(const SecretBytes& secret) {
  if (secret.size() < MacSigner::MIN_SECRET_LENGTH) {
    throw KeyLengthError("the HMAC secret must be at least 256 bits");
  }
}

}  // namespace

//
// Base classes
//

Base64Url JwsSigner::signChecked(const JwsHeader& header,
                                 std::span<const uint8_t> signing_input) const {
  ensureSupported(header.algorithm(), supportedAlgorithms());
  JOSE_LOG_DEBUG("Signing {} bytes with {}", signing_input.size(),
                 name(header.algorithm()));
  return Base64Url::encode(signImpl(header.algorithm(), signing_input));
}

bool JwsVerifier::verifyChecked(const JwsHeader& header,
                                std::span<const uint8_t> signing_input,
                                const Base64Url& signature) const {
  ensureSupported(header.algorithm(), supportedAlgorithms());
  if (!policy_.headerPasses(header)) {
    return false;
  }

  std::vector<uint8_t> signature_bytes;
  try {
    signature_bytes = signature.decode();
  } catch (const InvalidBase64Error& e) {
    JOSE_LOG_DEBUG("Rejecting JWS signature: {}", e.what());
    return false;
  }
  bool valid = verifyImpl(header.algorithm(), signing_input, signature_bytes);
  if (!valid) {
    JOSE_LOG_DEBUG("{} signature did not verify", name(header.algorithm()));
  }
  return valid;
}

//
// HMAC
//

MacSigner::MacSigner(SecretBytes secret, CryptoContext ctx)
    : JwsSigner(std::move(ctx)), secret_(std::move(secret)) {
  requireMacSecret(secret_);
}

size_t MacSigner::minSecretLength(JwsAlgorithm alg) {
  switch (alg) {
    case JwsAlgorithm::HS256:
      return 32;
    case JwsAlgorithm::HS384:
      return 48;
    case JwsAlgorithm::HS512:
      return 64;
    default:
      throw UnsupportedAlgorithmError(
          unsupportedJwsAlgorithm(name(alg), algorithms::HMAC));
  }
}

std::vector<uint8_t> MacSigner::signImpl(
    JwsAlgorithm alg, std::span<const uint8_t> signing_input) const {
  if (secret_.size() < minSecretLength(alg)) {
    throw KeyLengthError("the secret must be at least " +
                         std::to_string(minSecretLength(alg) * 8) +
                         " bits for " + std::string(name(alg)));
  }
  return hmac::compute(digestFor(alg), secret_, signing_input, ctx_);
}

MacVerifier::MacVerifier(SecretBytes secret, CriticalParamsPolicy policy,
                         CryptoContext ctx)
    : JwsVerifier(std::move(policy), std::move(ctx)),
      secret_(std::move(secret)) {
  requireMacSecret(secret_);
}

bool MacVerifier::verifyImpl(JwsAlgorithm alg,
                             std::span<const uint8_t> signing_input,
                             std::span<const uint8_t> signature) const {
  auto expected = hmac::compute(digestFor(alg), secret_, signing_input, ctx_);
  return secure_utils::constantTimeEqual(expected, signature);
}

//
// RSASSA
//

RsaSsaSigner::RsaSsaSigner(RsaKey key, CryptoContext ctx)
    : JwsSigner(std::move(ctx)), key_(std::move(key)) {
  if (!key_.hasPrivateKey()) {
    throw InvalidKeyError("RSA signing requires a private key");
  }
  requireRsaModulus(key_);
}

std::vector<uint8_t> RsaSsaSigner::signImpl(
    JwsAlgorithm alg, std::span<const uint8_t> signing_input) const {
  return digestSign(key_.get(), alg, signing_input, ctx_);
}

RsaSsaVerifier::RsaSsaVerifier(RsaKey key, CriticalParamsPolicy policy,
                               CryptoContext ctx)
    : JwsVerifier(std::move(policy), std::move(ctx)), key_(std::move(key)) {
  requireRsaModulus(key_);
}

bool RsaSsaVerifier::verifyImpl(JwsAlgorithm alg,
                                std::span<const uint8_t> signing_input,
                                std::span<const uint8_t> signature) const {
  return digestVerify(key_.get(), alg, signing_input, signature, ctx_);
}

//
// ECDSA
//

EcdsaSigner::EcdsaSigner(EcKey key, CryptoContext ctx)
    : JwsSigner(std::move(ctx)),
      key_(std::move(key)),
      alg_(ecdsa::resolveAlgorithm(key_.curve())) {
  if (!key_.hasPrivateKey()) {
    throw InvalidKeyError("ECDSA signing requires a private key");
  }
}

std::vector<uint8_t> EcdsaSigner::signImpl(
    JwsAlgorithm alg, std::span<const uint8_t> signing_input) const {
  auto der = digestSign(key_.get(), alg, signing_input, ctx_);
  return ecdsa::transcodeSignatureToConcat(
      der, ecdsa::signatureByteArrayLength(alg));
}

EcdsaVerifier::EcdsaVerifier(EcKey key, CriticalParamsPolicy policy,
                             CryptoContext ctx)
    : JwsVerifier(std::move(policy), std::move(ctx)),
      key_(std::move(key)),
      alg_(ecdsa::resolveAlgorithm(key_.curve())) {}

bool EcdsaVerifier::verifyImpl(JwsAlgorithm alg,
                               std::span<const uint8_t> signing_input,
                               std::span<const uint8_t> signature) const {
  if (signature.size() != ecdsa::signatureByteArrayLength(alg)) {
    return false;
  }
  std::vector<uint8_t> der;
  try {
    der = ecdsa::transcodeSignatureToDer(signature);
  } catch (const CryptoError& e) {
    JOSE_LOG_DEBUG("ECDSA signature transcoding failed: {}", e.what());
    return false;
  }
  return digestVerify(key_.get(), alg, signing_input, der, ctx_);
}

//
// JwsObject
//

JwsObject::JwsObject(JwsHeader header, std::vector<uint8_t> payload)
    : header_(std::move(header)),
      encoded_payload_(Base64Url::encode(std::span<const uint8_t>(payload))),
      payload_(std::move(payload)),
      state_(State::UNSIGNED) {}

JwsObject::JwsObject(JwsHeader header, std::string_view payload)
    : JwsObject(std::move(header),
                std::vector<uint8_t>(payload.begin(), payload.end())) {}

JwsObject::JwsObject(JwsHeader header, Base64Url encoded_payload,
                     Base64Url signature)
    : header_(std::move(header)),
      encoded_payload_(std::move(encoded_payload)),
      payload_(encoded_payload_.decode()),
      signature_(std::move(signature)),
      state_(State::SIGNED) {}

JwsObject JwsObject::parse(std::string_view compact) {
  auto parts = splitCompact(compact);
  if (parts.size() != 3) {
    throw MalformedInputError(
        "unexpected number of base64url parts, must be three");
  }
  if (parts[2].empty()) {
    throw MalformedInputError("missing JWS signature");
  }
  auto header = JwsHeader::parse(parts[0]);
  return JwsObject(std::move(header), std::move(parts[1]),
                   std::move(parts[2]));
}

std::string JwsObject::signingInput() const {
  std::string input = header_.toBase64Url().str();
  input += '.';
  input += encoded_payload_.str();
  return input;
}

void JwsObject::sign(const JwsSigner& signer) {
  if (state_ != State::UNSIGNED) {
    throw InvalidStateError("the JWS object must be in an unsigned state");
  }
  signature_ = signer.sign(header_, signingInput());
  state_ = State::SIGNED;
}

bool JwsObject::verify(const JwsVerifier& verifier) {
  if (state_ == State::UNSIGNED) {
    throw InvalidStateError(
        "the JWS object must be in a signed or verified state");
  }
  bool valid = verifier.verify(header_, signingInput(), *signature_);
  if (valid) state_ = State::VERIFIED;
  return valid;
}

std::string JwsObject::serialize() const {
  if (state_ == State::UNSIGNED) {
    throw InvalidStateError(
        "the JWS object must be in a signed or verified state");
  }
  return signingInput() + '.' + signature_->str();
}

}  // namespace jose
