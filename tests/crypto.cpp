#include <doctest/doctest.h>
#include "jose/crypto.hpp"
#include "jose/jwk.hpp"
#include "test_helpers.hpp"
#include <string_view>

using namespace jose;
using test_helpers::fromHex;
using test_helpers::secretFromHex;
using test_helpers::toHex;

namespace {

std::span<const uint8_t> bytesOf(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

const CryptoContext& ctx() { return CryptoContext::defaultContext(); }

}  // namespace

TEST_CASE("CryptoContextRandomBytes") {
    auto a = ctx().randomBytes(32);
    auto b = ctx().randomBytes(32);
    CHECK(a.size() == 32);
    CHECK(a != b);

    auto secret = ctx().randomSecret(16);
    CHECK(secret.size() == 16);
    CHECK(ctx().randomBytes(0).empty());
}

TEST_CASE("Sha256Digest") {
    auto hash = digest::compute("SHA256", bytesOf("abc"), ctx());
    CHECK(toHex(hash) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(digest::size("SHA384", ctx()) == 48);
    REQUIRE_THROWS_AS(digest::compute("NOT-A-DIGEST", bytesOf("abc"), ctx()),
                      CryptoError);
}

TEST_CASE("HmacSha256Rfc4231") {
    auto mac = hmac::compute("SHA256", bytesOf("Jefe"),
                             bytesOf("what do ya want for nothing?"), ctx());
    CHECK(toHex(mac) ==
          "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("AesKeyWrapRfc3394") {
    auto kek = fromHex("000102030405060708090A0B0C0D0E0F");
    auto key = fromHex("00112233445566778899AABBCCDDEEFF");

    auto wrapped = aes_kw::wrap(kek, key, ctx());
    CHECK(toHex(wrapped) == "1fa68b0a8112b447aef34bd8fb5a7b829d3e862371d2cfe5");

    auto unwrapped = aes_kw::unwrap(kek, wrapped, ctx());
    CHECK(secure_utils::toPlain(unwrapped) == key);
}

TEST_CASE("AesKeyWrapIntegrityFailure") {
    auto kek = fromHex("000102030405060708090A0B0C0D0E0F");
    auto wrapped = fromHex("1FA68B0A8112B447AEF34BD8FB5A7B829D3E862371D2CFE5");
    wrapped[3] ^= 0x01;
    REQUIRE_THROWS_AS(aes_kw::unwrap(kek, wrapped, ctx()), DecryptionError);

    auto other_kek = fromHex("0F0E0D0C0B0A09080706050403020100");
    wrapped[3] ^= 0x01;
    REQUIRE_THROWS_AS(aes_kw::unwrap(other_kek, wrapped, ctx()),
                      DecryptionError);
}

TEST_CASE("AesCbcRoundTrip") {
    auto key = ctx().randomSecret(crypto_constants::AES128_KEY_SIZE);
    auto iv = ctx().randomBytes(crypto_constants::CBC_IV_SIZE);

    auto ciphertext = aes_cbc::encrypt(key, iv, bytesOf("sixteen byte msg"),
                                       ctx());
    CHECK(ciphertext.size() == 32);  // full block of padding

    auto plaintext = aes_cbc::decrypt(key, iv, ciphertext, ctx());
    CHECK(std::string(plaintext.begin(), plaintext.end()) ==
          "sixteen byte msg");
}

TEST_CASE("AesCbcBadInput") {
    auto key = ctx().randomSecret(crypto_constants::AES256_KEY_SIZE);
    auto iv = ctx().randomBytes(crypto_constants::CBC_IV_SIZE);
    auto ciphertext = aes_cbc::encrypt(key, iv, bytesOf("payload"), ctx());

    auto short_iv = ctx().randomBytes(8);
    REQUIRE_THROWS_AS(aes_cbc::decrypt(key, short_iv, ciphertext, ctx()),
                      CryptoError);

    std::vector<uint8_t> truncated(ciphertext.begin(), ciphertext.end() - 1);
    REQUIRE_THROWS_AS(aes_cbc::decrypt(key, iv, truncated, ctx()),
                      CryptoError);
}

TEST_CASE("AesGcmRoundTripAndTamper") {
    auto key = ctx().randomSecret(crypto_constants::AES256_KEY_SIZE);
    auto iv = ctx().randomBytes(crypto_constants::GCM_IV_SIZE);
    auto aad = bytesOf("header");

    auto sealed = aes_gcm::encrypt(key, iv, bytesOf("attack at dawn"), aad,
                                   ctx());
    CHECK(sealed.authTag.size() == crypto_constants::GCM_TAG_SIZE);
    CHECK(sealed.cipherText.size() == 14);

    auto opened = aes_gcm::decrypt(key, iv, sealed.cipherText, aad,
                                   sealed.authTag, ctx());
    CHECK(std::string(opened.begin(), opened.end()) == "attack at dawn");

    auto tag = sealed.authTag;
    tag[0] ^= 0x80;
    REQUIRE_THROWS_AS(
        aes_gcm::decrypt(key, iv, sealed.cipherText, aad, tag, ctx()),
        DecryptionError);
    REQUIRE_THROWS_AS(aes_gcm::decrypt(key, iv, sealed.cipherText,
                                       bytesOf("other"), sealed.authTag, ctx()),
                      DecryptionError);
}

TEST_CASE("RsaOaepRoundTrip") {
    const auto& key = test_helpers::sharedRsaKey();
    auto cek = ctx().randomSecret(32);

    for (auto padding : {rsa::Padding::PKCS1_V1_5, rsa::Padding::OAEP_SHA1,
                         rsa::Padding::OAEP_SHA256}) {
        auto encrypted = rsa::encrypt(key.get(), padding, cek, ctx());
        CHECK(encrypted.size() == 256);
        auto decrypted = rsa::decrypt(key.get(), padding, encrypted, ctx());
        CHECK(decrypted == cek);
    }
    CHECK(rsa::modulusBits(key.get()) == 2048);
}

TEST_CASE("RsaOaepWrongPadding") {
    const auto& key = test_helpers::sharedRsaKey();
    auto cek = ctx().randomSecret(16);
    auto encrypted =
        rsa::encrypt(key.get(), rsa::Padding::OAEP_SHA256, cek, ctx());
    REQUIRE_THROWS_AS(
        rsa::decrypt(key.get(), rsa::Padding::OAEP_SHA1, encrypted, ctx()),
        CryptoError);
}

TEST_CASE("EcdhSharedSecretAgreement") {
    auto alice = EcKey::generate(Curve::P256);
    auto bob = EcKey::generate(Curve::P256);

    auto z1 = ecdh::deriveSharedSecret(alice.get(), bob.publicKey().get(), ctx());
    auto z2 = ecdh::deriveSharedSecret(bob.get(), alice.publicKey().get(), ctx());
    CHECK(z1.size() == 32);
    CHECK(z1 == z2);
}

TEST_CASE("Pbkdf2Rfc6070") {
    auto key = pbkdf2::deriveKey(bytesOf("password"), bytesOf("salt"), 4096,
                                 "SHA1", 20, ctx());
    CHECK(toHex(key) == "4b007901b765489abead49d926f721d065a429c1");
}
