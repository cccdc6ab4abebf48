#include "jose/jwe.hpp"

#include <string>

#include "jose/error.hpp"
#include "jose/logging.hpp"

namespace jose {

namespace {

std::optional<Base64Url> nonEmpty(Base64Url part) {
  if (part.empty()) return std::nullopt;
  return part;
}

Base64Url checkedPart(Base64Url part, std::string_view what) {
  try {
    (void)part.decode();
  } catch (const InvalidBase64Error& e) {
    throw MalformedInputError("invalid JWE " + std::string(what) + ": " +
                              e.what());
  }
  return part;
}

}  // namespace

//
// JweEncrypter
//

JweCryptoParts JweEncrypter::encrypt(const JweHeader& header,
                                     std::span<const uint8_t> plaintext) const {
  auto produced = key_management::produceCek(key_management_, header, ctx_);
  JOSE_LOG_DEBUG("Encrypting with {} and {}", name(header.algorithm()),
                 name(header.encryptionMethod()));
  return content_crypto::encrypt(produced.header, plaintext, produced.cek,
                                 std::move(produced.encryptedKey), ctx_);
}

//
// JweDecrypter
//

std::vector<uint8_t> JweDecrypter::decrypt(
    const JweHeader& header, const std::optional<Base64Url>& encrypted_key,
    const std::optional<Base64Url>& iv, const Base64Url& cipher_text,
    const std::optional<Base64Url>& auth_tag) const {
  if (!iv || iv->empty()) {
    throw MalformedInputError("missing JWE initialization vector");
  }
  if (!auth_tag || auth_tag->empty()) {
    throw MalformedInputError("missing JWE authentication tag");
  }
  key_management::ensureSupported(header.algorithm(), supportedAlgorithms());
  if (!policy_.headerPasses(header)) {
    throw DecryptionError();
  }

  try {
    auto cek = key_management::recoverCek(key_management_, header,
                                          encrypted_key, ctx_);
    return content_crypto::decrypt(header, encrypted_key, *iv, cipher_text,
                                   *auth_tag, cek, ctx_);
  } catch (const InvalidBase64Error& e) {
    JOSE_LOG_DEBUG("JWE decryption hit invalid base64url: {}", e.what());
    throw DecryptionError();
  }
}

//
// JweObject
//

JweObject::JweObject(JweHeader header, std::vector<uint8_t> payload)
    : header_(std::move(header)),
      payload_(std::move(payload)),
      state_(State::UNENCRYPTED) {}

JweObject::JweObject(JweHeader header, std::string_view payload)
    : JweObject(std::move(header),
                std::vector<uint8_t>(payload.begin(), payload.end())) {}

JweObject::JweObject(JweHeader header, std::optional<Base64Url> encrypted_key,
                     std::optional<Base64Url> iv, Base64Url cipher_text,
                     std::optional<Base64Url> auth_tag)
    : header_(std::move(header)),
      encrypted_key_(std::move(encrypted_key)),
      iv_(std::move(iv)),
      cipher_text_(std::move(cipher_text)),
      auth_tag_(std::move(auth_tag)),
      state_(State::ENCRYPTED) {}

JweObject JweObject::parse(std::string_view compact) {
  auto parts = splitCompact(compact);
  if (parts.size() != 5) {
    throw MalformedInputError(
        "unexpected number of base64url parts, must be five");
  }
  auto header = JweHeader::parse(parts[0]);
  return JweObject(std::move(header),
                   nonEmpty(checkedPart(std::move(parts[1]), "encrypted key")),
                   nonEmpty(checkedPart(std::move(parts[2]),
                                        "initialization vector")),
                   checkedPart(std::move(parts[3]), "ciphertext"),
                   nonEmpty(checkedPart(std::move(parts[4]),
                                        "authentication tag")));
}

const std::vector<uint8_t>& JweObject::payload() const {
  if (state_ == State::ENCRYPTED) {
    throw InvalidStateError("the JWE payload is not available until decrypted");
  }
  return payload_;
}

std::string JweObject::payloadAsString() const {
  const auto& bytes = payload();
  return std::string(bytes.begin(), bytes.end());
}

void JweObject::encrypt(const JweEncrypter& encrypter) {
  if (state_ != State::UNENCRYPTED) {
    throw InvalidStateError("the JWE object must be in an unencrypted state");
  }
  auto parts = encrypter.encrypt(header_, std::span<const uint8_t>(payload_));
  header_ = std::move(parts.header);
  encrypted_key_ = std::move(parts.encryptedKey);
  iv_ = std::move(parts.iv);
  cipher_text_ = std::move(parts.cipherText);
  auth_tag_ = std::move(parts.authTag);
  state_ = State::ENCRYPTED;
}

void JweObject::decrypt(const JweDecrypter& decrypter) {
  if (state_ != State::ENCRYPTED) {
    throw InvalidStateError("the JWE object must be in an encrypted state");
  }
  payload_ = decrypter.decrypt(header_, encrypted_key_, iv_, cipher_text_,
                               auth_tag_);
  state_ = State::DECRYPTED;
}

std::string JweObject::serialize() const {
  if (state_ == State::UNENCRYPTED) {
    throw InvalidStateError(
        "the JWE object must be in an encrypted or decrypted state");
  }
  std::string out = header_.toBase64Url().str();
  out += '.';
  if (encrypted_key_) out += encrypted_key_->str();
  out += '.';
  if (iv_) out += iv_->str();
  out += '.';
  out += cipher_text_.str();
  out += '.';
  if (auth_tag_) out += auth_tag_->str();
  return out;
}

}  // namespace jose
