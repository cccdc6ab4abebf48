#include <doctest/doctest.h>
#include "jose/error.hpp"
#include "jose/jwe.hpp"
#include "jose/jwk.hpp"
#include "jose/jws.hpp"
#include "test_helpers.hpp"
#include <string>

using namespace jose;

namespace {

// RFC 7516 appendix A.3
constexpr const char* kA128KwKek = "GawgguFyGrWKav7AX4VKUg";
constexpr const char* kA128KwCompact =
    "eyJhbGciOiJBMTI4S1ciLCJlbmMiOiJBMTI4Q0JDLUhTMjU2In0."
    "6KB707dM9YTIgHtLvtgWQ8mKwboJW3of9locizkDTHzBC2IlrT1oOQ."
    "AxY8DCtDaGlsbGljb3RoZQ."
    "KDlTtXchhZTGufMYmOYGS4HffxPSUrfmqCHXaI9wOGY."
    "U0m_YmjN04DJvceFICbCVQ";

SecretBytes decodeSecret(const char* encoded) {
    return secure_utils::toSecret(
        std::span<const uint8_t>(base64UrlDecode(encoded)));
}

}  // namespace

TEST_CASE("DecryptPublishedA128KwExample") {
    auto jwe = JweObject::parse(kA128KwCompact);
    CHECK(jwe.header().algorithm() == JweAlgorithm::A128KW);
    CHECK(jwe.header().encryptionMethod() == EncryptionMethod::A128CBC_HS256);

    jwe.decrypt(JweDecrypter{AesKeyWrapManagement(decodeSecret(kA128KwKek))});
    CHECK(jwe.payloadAsString() == "Live long and prosper.");
    CHECK(jwe.serialize() == kA128KwCompact);
}

TEST_CASE("NestedSignedThenEncryptedToken") {
    const auto& signing_key = test_helpers::sharedEcKey(Curve::P256);
    const auto& recipient_key = test_helpers::sharedRsaKey();
    std::string claims = R"({"iss":"joe","exp":1300819380})";

    // Sender signs, then encrypts the compact JWS with "cty": "JWT"
    JwsObject jws(JwsHeader::Builder(JwsAlgorithm::ES256).build(), claims);
    jws.sign(EcdsaSigner(signing_key));

    JweObject outer(JweHeader::Builder(JweAlgorithm::RSA_OAEP_256,
                                       EncryptionMethod::A256GCM)
                        .contentType("JWT")
                        .build(),
                    jws.serialize());
    outer.encrypt(JweEncrypter{RsaKeyManagement(recipient_key.publicKey())});
    auto token = outer.serialize();

    // Recipient reverses the steps
    auto received = JweObject::parse(token);
    CHECK(received.header().contentType() == "JWT");
    received.decrypt(JweDecrypter{RsaKeyManagement(recipient_key)});

    auto inner = JwsObject::parse(received.payloadAsString());
    CHECK(inner.verify(EcdsaVerifier(signing_key.publicKey())));
    CHECK(inner.payloadAsString() == claims);
}

TEST_CASE("EncryptToPublishedEcJwk") {
    const auto& recipient = test_helpers::sharedEcKey(Curve::P384);
    auto published = recipient.toPublicJwk();
    auto kid = recipient.thumbprint();

    // The sender only sees the JWK
    auto sender_view = EcKey::fromPublicJwk(published);
    CHECK_FALSE(sender_view.hasPrivateKey());
    CHECK(sender_view.thumbprint() == kid);

    JweObject jwe(JweHeader::Builder(JweAlgorithm::ECDH_ES_A256KW,
                                     EncryptionMethod::A256CBC_HS512)
                      .keyId(kid)
                      .agreementPartyUInfo(Base64Url::encode(
                          std::string_view("sender")))
                      .agreementPartyVInfo(Base64Url::encode(
                          std::string_view("recipient")))
                      .build(),
                  std::string_view("meet at noon"));
    jwe.encrypt(JweEncrypter{EcdhKeyManagement(sender_view)});
    auto compact = jwe.serialize();

    auto received = JweObject::parse(compact);
    REQUIRE(received.header().keyId() == kid);
    received.decrypt(JweDecrypter{EcdhKeyManagement(recipient)});
    CHECK(received.payloadAsString() == "meet at noon");

    // Another recipient on the same curve cannot read it
    auto stranger = EcKey::generate(Curve::P384);
    auto again = JweObject::parse(compact);
    REQUIRE_THROWS_AS(again.decrypt(JweDecrypter{EcdhKeyManagement(stranger)}),
                      DecryptionError);
}

TEST_CASE("KeysRestoredFromDer") {
    const auto& rsa = test_helpers::sharedRsaKey();
    auto restored = RsaKey::fromPrivateKeyDer(rsa.privateKeyDer());
    CHECK(restored.hasPrivateKey());
    CHECK(restored.thumbprint() == rsa.thumbprint());

    JweObject jwe(JweHeader::Builder(JweAlgorithm::RSA_OAEP,
                                     EncryptionMethod::A128CBC_HS256)
                      .build(),
                  std::string_view("persisted"));
    jwe.encrypt(JweEncrypter{RsaKeyManagement(
        RsaKey::fromPublicKeyDer(rsa.publicKeyDer()))});
    auto received = JweObject::parse(jwe.serialize());
    received.decrypt(JweDecrypter{RsaKeyManagement(restored)});
    CHECK(received.payloadAsString() == "persisted");

    const auto& ec = test_helpers::sharedEcKey(Curve::P521);
    auto ec_restored = EcKey::fromPrivateKeyDer(ec.privateKeyDer());
    CHECK(ec_restored.curve() == Curve::P521);

    JwsObject jws(JwsHeader::Builder(JwsAlgorithm::ES512).build(),
                  std::string_view("persisted"));
    jws.sign(EcdsaSigner(ec_restored));
    auto parsed = JwsObject::parse(jws.serialize());
    CHECK(parsed.verify(
        EcdsaVerifier(EcKey::fromPublicKeyDer(ec.publicKeyDer()))));
}

TEST_CASE("PasswordProtectedCompressedPayload") {
    auto password = secure_utils::toSecret(std::string_view("open sesame"));
    std::string document(2000, 'z');

    JweObject jwe(JweHeader::Builder(JweAlgorithm::PBES2_HS384_A192KW,
                                     EncryptionMethod::A192GCM)
                      .compression(CompressionAlgorithm::DEF)
                      .build(),
                  document);
    jwe.encrypt(JweEncrypter{PasswordKeyManagement(password, 16, 4096)});
    CHECK(jwe.header().pbes2Count() == 4096u);
    CHECK(jwe.header().pbes2Salt()->decode().size() == 16);

    auto received = JweObject::parse(jwe.serialize());
    received.decrypt(JweDecrypter{PasswordKeyManagement(password)});
    CHECK(received.payloadAsString() == document);
}
