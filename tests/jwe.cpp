#include <doctest/doctest.h>
#include "jose/compression.hpp"
#include "jose/content_crypto.hpp"
#include "jose/crypto.hpp"
#include "jose/error.hpp"
#include "jose/jwe.hpp"
#include "test_helpers.hpp"
#include <functional>
#include <set>
#include <span>
#include <string>
#include <vector>

using namespace jose;
using test_helpers::sequentialKey;

namespace {

std::vector<std::string> splitParts(const std::string& compact) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto dot = compact.find('.', start);
        parts.push_back(compact.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

std::string joinParts(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += '.';
        out += parts[i];
    }
    return out;
}

// Flip one bit in the middle of a base64url segment
std::string tamperSegment(const std::string& segment) {
    auto bytes = base64UrlDecode(segment);
    bytes[bytes.size() / 2] ^= 0x01;
    return base64UrlEncode(bytes);
}

// Flip one bit of a character inside the decoded JSON header
std::string flipHeaderCharacter(const std::string& segment,
                                const std::string& marker) {
    auto json = base64UrlDecode(segment);
    std::string text(json.begin(), json.end());
    auto pos = text.find(marker);
    REQUIRE(pos != std::string::npos);
    json[pos + 1] ^= 0x01;
    return base64UrlEncode(json);
}

std::string replaceHeader(const std::string& segment,
                          const std::function<void(JweHeader::Builder&)>& edit) {
    JweHeader::Builder builder(JweHeader::parse(Base64Url(segment)));
    edit(builder);
    return builder.build().toBase64Url().str();
}

// Swap one character in the middle of a segment for one outside the
// base64url alphabet
std::string corruptCharacter(const std::string& segment) {
    auto out = segment;
    out[out.size() / 2] = '+';
    return out;
}

KeyManagement strategyFor(JweAlgorithm alg) {
    switch (alg) {
        case JweAlgorithm::RSA1_5:
        case JweAlgorithm::RSA_OAEP:
        case JweAlgorithm::RSA_OAEP_256:
            return RsaKeyManagement(test_helpers::sharedRsaKey());
        case JweAlgorithm::A128KW:
            return AesKeyWrapManagement(sequentialKey(16));
        case JweAlgorithm::A192KW:
            return AesKeyWrapManagement(sequentialKey(24));
        case JweAlgorithm::A256KW:
            return AesKeyWrapManagement(sequentialKey(32));
        case JweAlgorithm::A128GCMKW:
            return AesGcmKeyWrapManagement(sequentialKey(16));
        case JweAlgorithm::A192GCMKW:
            return AesGcmKeyWrapManagement(sequentialKey(24));
        case JweAlgorithm::A256GCMKW:
            return AesGcmKeyWrapManagement(sequentialKey(32));
        case JweAlgorithm::ECDH_ES:
        case JweAlgorithm::ECDH_ES_A128KW:
        case JweAlgorithm::ECDH_ES_A192KW:
        case JweAlgorithm::ECDH_ES_A256KW:
            return EcdhKeyManagement(test_helpers::sharedEcKey(Curve::P256));
        case JweAlgorithm::PBES2_HS256_A128KW:
        case JweAlgorithm::PBES2_HS384_A192KW:
        case JweAlgorithm::PBES2_HS512_A256KW:
            return PasswordKeyManagement(
                secure_utils::toSecret(std::string_view("Thus from my lips")));
        case JweAlgorithm::DIR:
            break;
    }
    return DirectKeyManagement(sequentialKey(32));
}

std::vector<JweAlgorithm> allAlgorithms() {
    std::vector<JweAlgorithm> all;
    for (auto group : {std::span<const JweAlgorithm>(algorithms::RSA),
                       std::span<const JweAlgorithm>(algorithms::AES_KW),
                       std::span<const JweAlgorithm>(algorithms::AES_GCM_KW),
                       std::span<const JweAlgorithm>(algorithms::ECDH_ES),
                       std::span<const JweAlgorithm>(algorithms::PBES2)}) {
        all.insert(all.end(), group.begin(), group.end());
    }
    return all;
}

std::string encryptCompact(const KeyManagement& km, const JweHeader& header,
                           std::string_view payload) {
    JweObject jwe(header, payload);
    jwe.encrypt(JweEncrypter{km});
    CHECK(jwe.state() == JweObject::State::ENCRYPTED);
    return jwe.serialize();
}

std::string decryptCompact(const KeyManagement& km, const std::string& compact,
                           CriticalParamsPolicy policy = {}) {
    auto jwe = JweObject::parse(compact);
    CHECK(jwe.state() == JweObject::State::ENCRYPTED);
    jwe.decrypt(JweDecrypter{km, std::move(policy)});
    CHECK(jwe.state() == JweObject::State::DECRYPTED);
    return jwe.payloadAsString();
}

const std::string kMessage = "The true sign of intelligence is not knowledge "
                             "but imagination.";

}  // namespace

TEST_CASE("JWE: Round trip for every key management and content algorithm") {
    for (auto alg : allAlgorithms()) {
        auto km = strategyFor(alg);
        for (auto enc : algorithms::ALL_ENC) {
            CAPTURE(name(alg));
            CAPTURE(name(enc));
            auto header = JweHeader::Builder(alg, enc).keyId("k1").build();
            auto compact = encryptCompact(km, header, kMessage);
            CHECK(decryptCompact(km, compact) == kMessage);
        }
    }
}

TEST_CASE("JWE: Direct encryption for each compatible method") {
    for (size_t length : {32, 48, 64}) {
        KeyManagement km = DirectKeyManagement(sequentialKey(length));
        for (auto enc : std::get<DirectKeyManagement>(km)
                            .compatibleEncryptionMethods()) {
            auto header = JweHeader::Builder(JweAlgorithm::DIR, enc).build();
            auto compact = encryptCompact(km, header, kMessage);
            auto parts = splitParts(compact);
            REQUIRE(parts.size() == 5);
            CHECK(parts[1].empty());
            CHECK(decryptCompact(km, compact) == kMessage);
        }
    }
}

TEST_CASE("JWE: Direct A256GCM with the wrong key") {
    KeyManagement sender = DirectKeyManagement(sequentialKey(32));
    KeyManagement receiver = DirectKeyManagement(
        test_helpers::secretFromHex("000102030405060708090a0b0c0d0e0f"
                                    "101112131415161718191a1b1c1d1e1e"));
    auto header =
        JweHeader::Builder(JweAlgorithm::DIR, EncryptionMethod::A256GCM).build();
    auto compact = encryptCompact(sender, header, kMessage);
    CHECK(base64UrlDecode(splitParts(compact)[2]).size() == 12);
    CHECK(base64UrlDecode(splitParts(compact)[4]).size() == 16);
    REQUIRE_THROWS_AS(decryptCompact(receiver, compact), DecryptionError);
}

TEST_CASE("JWE: Compressed payload") {
    KeyManagement km = AesKeyWrapManagement(sequentialKey(16));
    std::string payload(4096, 'a');
    auto header = JweHeader::Builder(JweAlgorithm::A128KW,
                                     EncryptionMethod::A128CBC_HS256)
                      .compression(CompressionAlgorithm::DEF)
                      .build();
    auto compact = encryptCompact(km, header, payload);
    auto parsed = JweObject::parse(compact);
    CHECK(parsed.header().compression() == CompressionAlgorithm::DEF);
    CHECK(base64UrlDecode(parsed.cipherText().str()).size() < 256);
    CHECK(decryptCompact(km, compact) == payload);
}

TEST_CASE("JWE: Compressed payload beyond the inflate limit") {
    KeyManagement km = AesKeyWrapManagement(sequentialKey(16));
    std::string payload(compression::DEFAULT_MAX_INFLATED_SIZE + 1, 'z');
    auto header = JweHeader::Builder(JweAlgorithm::A128KW,
                                     EncryptionMethod::A128GCM)
                      .compression(CompressionAlgorithm::DEF)
                      .build();
    auto compact = encryptCompact(km, header, payload);
    CHECK(compact.size() < 64 * 1024);
    REQUIRE_THROWS_AS(decryptCompact(km, compact), DecryptionError);
}

TEST_CASE("JWE: Tampered segments fail authentication") {
    for (auto alg : {JweAlgorithm::A256KW, JweAlgorithm::RSA_OAEP,
                     JweAlgorithm::ECDH_ES, JweAlgorithm::A128GCMKW}) {
        for (auto enc : {EncryptionMethod::A128CBC_HS256,
                         EncryptionMethod::A256GCM,
                         EncryptionMethod::A256CBC_HS512_LEGACY}) {
            CAPTURE(name(alg));
            CAPTURE(name(enc));
            auto km = strategyFor(alg);
            auto parts = splitParts(encryptCompact(
                km, JweHeader::Builder(alg, enc).build(), kMessage));
            REQUIRE(parts.size() == 5);

            for (size_t index : {2, 3, 4}) {
                auto tampered = parts;
                tampered[index] = tamperSegment(parts[index]);
                REQUIRE_THROWS_AS(decryptCompact(km, joinParts(tampered)),
                                  DecryptionError);
            }
        }
    }
}

TEST_CASE("JWE: The protected header is authenticated") {
    KeyManagement km = AesKeyWrapManagement(sequentialKey(32));
    auto header = JweHeader::Builder(JweAlgorithm::A256KW,
                                     EncryptionMethod::A256GCM)
                      .keyId("alice")
                      .build();
    auto parts = splitParts(encryptCompact(km, header, kMessage));

    auto parsed = JweHeader::parse(Base64Url(parts[0]));
    CHECK(parsed.keyId() == "alice");
    parts[0] = JweHeader::Builder(parsed).keyId("mallory").build()
                   .toBase64Url()
                   .str();
    REQUIRE_THROWS_AS(decryptCompact(km, joinParts(parts)), DecryptionError);
}

TEST_CASE("JWE: Corrupt RSA1_5 key fails only at content authentication") {
    KeyManagement km = RsaKeyManagement(test_helpers::sharedRsaKey());
    for (auto enc : {EncryptionMethod::A128CBC_HS256, EncryptionMethod::A128GCM}) {
        auto parts = splitParts(encryptCompact(
            km, JweHeader::Builder(JweAlgorithm::RSA1_5, enc).build(),
            kMessage));
        parts[1] = tamperSegment(parts[1]);
        try {
            decryptCompact(km, joinParts(parts));
            FAIL("expected DecryptionError");
        } catch (const DecryptionError& e) {
            CHECK(e.errorCode() == JoseErrorCode::DECRYPTION_FAILED);
        }
    }
}

TEST_CASE("JWE: Unsupported algorithm for the decrypter") {
    auto compact = encryptCompact(
        strategyFor(JweAlgorithm::A128KW),
        JweHeader::Builder(JweAlgorithm::A128KW, EncryptionMethod::A128GCM)
            .build(),
        kMessage);
    REQUIRE_THROWS_AS(decryptCompact(strategyFor(JweAlgorithm::RSA_OAEP),
                                     compact),
                      UnsupportedAlgorithmError);
}

TEST_CASE("JWE: Critical header parameters") {
    KeyManagement km = AesKeyWrapManagement(sequentialKey(16));
    auto header = JweHeader::Builder(JweAlgorithm::A128KW,
                                     EncryptionMethod::A128GCM)
                      .customParam("exp", 1363284000)
                      .criticalParams({"exp"})
                      .build();
    auto compact = encryptCompact(km, header, kMessage);

    REQUIRE_THROWS_AS(decryptCompact(km, compact), DecryptionError);
    CHECK(decryptCompact(km, compact,
                         CriticalParamsPolicy(std::set<std::string>{"exp"})) ==
          kMessage);
}

TEST_CASE("JWE: Missing IV or tag") {
    KeyManagement km = AesKeyWrapManagement(sequentialKey(16));
    auto parts = splitParts(encryptCompact(
        km,
        JweHeader::Builder(JweAlgorithm::A128KW, EncryptionMethod::A128GCM)
            .build(),
        kMessage));

    auto no_iv = parts;
    no_iv[2].clear();
    REQUIRE_THROWS_AS(decryptCompact(km, joinParts(no_iv)),
                      MalformedInputError);

    auto no_tag = parts;
    no_tag[4].clear();
    REQUIRE_THROWS_AS(decryptCompact(km, joinParts(no_tag)),
                      MalformedInputError);
}

TEST_CASE("JWE: Parse errors") {
    REQUIRE_THROWS_AS(JweObject::parse("a.b.c.d"), MalformedInputError);
    REQUIRE_THROWS_AS(JweObject::parse("a.b.c.d.e.f"), MalformedInputError);
    REQUIRE_THROWS_AS(JweObject::parse(""), MalformedInputError);

    auto zip = Base64Url::encode(std::string_view(
        R"({"alg":"dir","enc":"A128GCM","zip":"LZW"})"));
    REQUIRE_THROWS_AS(JweObject::parse(zip.str() + "..AAAA.AAAA.AAAA"),
                      UnsupportedAlgorithmError);

    auto no_enc = Base64Url::encode(std::string_view(R"({"alg":"dir"})"));
    REQUIRE_THROWS_AS(JweObject::parse(no_enc.str() + "..AAAA.AAAA.AAAA"),
                      MalformedInputError);
}

TEST_CASE("JWE: Object state transitions") {
    KeyManagement km = DirectKeyManagement(sequentialKey(16));
    auto header =
        JweHeader::Builder(JweAlgorithm::DIR, EncryptionMethod::A128GCM).build();

    JweObject jwe(header, kMessage);
    CHECK(jwe.state() == JweObject::State::UNENCRYPTED);
    CHECK(jwe.payloadAsString() == kMessage);
    REQUIRE_THROWS_AS(jwe.serialize(), InvalidStateError);
    REQUIRE_THROWS_AS(jwe.decrypt(JweDecrypter{km}), InvalidStateError);

    jwe.encrypt(JweEncrypter{km});
    REQUIRE_THROWS_AS(jwe.encrypt(JweEncrypter{km}), InvalidStateError);
    REQUIRE_THROWS_AS(jwe.payload(), InvalidStateError);

    auto parsed = JweObject::parse(jwe.serialize());
    CHECK(parsed.cipherText() == jwe.cipherText());
    CHECK_FALSE(parsed.encryptedKey().has_value());
    parsed.decrypt(JweDecrypter{km});
    CHECK(parsed.payloadAsString() == kMessage);
    REQUIRE_THROWS_AS(parsed.decrypt(JweDecrypter{km}), InvalidStateError);
    CHECK(parsed.serialize() == jwe.serialize());
}

TEST_CASE("JWE: Encrypter derives the header") {
    JweEncrypter encrypter{EcdhKeyManagement(
        test_helpers::sharedEcKey(Curve::P521))};
    CHECK(encrypter.supportedAlgorithms().size() == 4);
    CHECK(encrypter.supportedEncryptionMethods().size() == 8);

    auto header = JweHeader::Builder(JweAlgorithm::ECDH_ES_A128KW,
                                     EncryptionMethod::A192CBC_HS384)
                      .build();
    auto parts = encrypter.encrypt(header, std::string_view("hi"));
    CHECK(header.ephemeralPublicKey() == nullptr);
    CHECK(parts.header.ephemeralPublicKey() != nullptr);
    CHECK(parts.encryptedKey.has_value());
}

TEST_CASE("JWE: Header bit flip fails for every key management family") {
    for (auto alg : {JweAlgorithm::DIR, JweAlgorithm::A128KW,
                     JweAlgorithm::A128GCMKW, JweAlgorithm::RSA_OAEP,
                     JweAlgorithm::ECDH_ES, JweAlgorithm::ECDH_ES_A128KW,
                     JweAlgorithm::PBES2_HS256_A128KW}) {
        for (auto enc : {EncryptionMethod::A128CBC_HS256,
                         EncryptionMethod::A256GCM}) {
            CAPTURE(name(alg));
            CAPTURE(name(enc));
            auto km = strategyFor(alg);
            auto header = JweHeader::Builder(alg, enc).keyId("k1").build();
            auto parts = splitParts(encryptCompact(km, header, kMessage));
            REQUIRE(parts.size() == 5);

            // "k1" becomes "j1"
            parts[0] = flipHeaderCharacter(parts[0], "\"k1\"");
            auto parsed = JweHeader::parse(Base64Url(parts[0]));
            CHECK(parsed.keyId() == "j1");
            REQUIRE_THROWS_AS(decryptCompact(km, joinParts(parts)),
                              DecryptionError);
        }
    }
}

TEST_CASE("JWE: Rewritten key management header parameters") {
    const std::vector<uint8_t> other_iv(12, 0x5a);
    const std::vector<uint8_t> other_tag(16, 0xa5);

    SUBCASE("A128GCMKW iv and tag") {
        auto km = strategyFor(JweAlgorithm::A128GCMKW);
        auto parts = splitParts(encryptCompact(
            km,
            JweHeader::Builder(JweAlgorithm::A128GCMKW,
                               EncryptionMethod::A128GCM)
                .build(),
            kMessage));

        auto iv_changed = parts;
        iv_changed[0] = replaceHeader(parts[0], [&](JweHeader::Builder& b) {
            b.iv(Base64Url::encode(other_iv));
        });
        REQUIRE_THROWS_AS(decryptCompact(km, joinParts(iv_changed)),
                          DecryptionError);

        auto tag_changed = parts;
        tag_changed[0] = replaceHeader(parts[0], [&](JweHeader::Builder& b) {
            b.authTag(Base64Url::encode(other_tag));
        });
        REQUIRE_THROWS_AS(decryptCompact(km, joinParts(tag_changed)),
                          DecryptionError);
    }

    SUBCASE("ECDH-ES epk") {
        auto stranger = EcKey::generate(Curve::P256);
        for (auto alg : {JweAlgorithm::ECDH_ES, JweAlgorithm::ECDH_ES_A128KW}) {
            CAPTURE(name(alg));
            auto km = strategyFor(alg);
            auto parts = splitParts(encryptCompact(
                km, JweHeader::Builder(alg, EncryptionMethod::A128GCM).build(),
                kMessage));
            parts[0] = replaceHeader(parts[0], [&](JweHeader::Builder& b) {
                b.ephemeralPublicKey(stranger.toPublicJwk());
            });
            REQUIRE_THROWS_AS(decryptCompact(km, joinParts(parts)),
                              DecryptionError);
        }
    }

    SUBCASE("PBES2 salt and count") {
        auto km = strategyFor(JweAlgorithm::PBES2_HS256_A128KW);
        auto parts = splitParts(encryptCompact(
            km,
            JweHeader::Builder(JweAlgorithm::PBES2_HS256_A128KW,
                               EncryptionMethod::A128GCM)
                .build(),
            kMessage));

        auto salt_changed = parts;
        salt_changed[0] = replaceHeader(parts[0], [&](JweHeader::Builder& b) {
            b.pbes2Salt(Base64Url::encode(other_tag));
        });
        REQUIRE_THROWS_AS(decryptCompact(km, joinParts(salt_changed)),
                          DecryptionError);

        auto count_changed = parts;
        count_changed[0] = replaceHeader(parts[0], [&](JweHeader::Builder& b) {
            b.pbes2Count(PasswordKeyManagement::MIN_ITERATIONS + 1);
        });
        REQUIRE_THROWS_AS(decryptCompact(km, joinParts(count_changed)),
                          DecryptionError);
    }
}

TEST_CASE("JWE: Tampered encrypted key fails for every wrapping family") {
    for (auto alg : {JweAlgorithm::A128KW, JweAlgorithm::A256KW,
                     JweAlgorithm::A128GCMKW, JweAlgorithm::A256GCMKW,
                     JweAlgorithm::RSA_OAEP, JweAlgorithm::RSA_OAEP_256,
                     JweAlgorithm::ECDH_ES_A128KW, JweAlgorithm::ECDH_ES_A256KW,
                     JweAlgorithm::PBES2_HS256_A128KW,
                     JweAlgorithm::PBES2_HS512_A256KW}) {
        for (auto enc : {EncryptionMethod::A128CBC_HS256,
                         EncryptionMethod::A128GCM}) {
            CAPTURE(name(alg));
            CAPTURE(name(enc));
            auto km = strategyFor(alg);
            auto parts = splitParts(encryptCompact(
                km, JweHeader::Builder(alg, enc).build(), kMessage));
            REQUIRE_FALSE(parts[1].empty());
            parts[1] = tamperSegment(parts[1]);
            REQUIRE_THROWS_AS(decryptCompact(km, joinParts(parts)),
                              DecryptionError);
        }
    }
}

TEST_CASE("JWE: AES GCM key wrap content AAD covers the final header") {
    const auto& ctx = CryptoContext::defaultContext();
    auto kek = sequentialKey(16);
    KeyManagement km = AesGcmKeyWrapManagement(kek);
    auto header = JweHeader::Builder(JweAlgorithm::A128GCMKW,
                                     EncryptionMethod::A128GCM)
                      .build();
    auto parts = splitParts(encryptCompact(km, header, kMessage));
    REQUIRE(parts.size() == 5);

    // The serialized header carries the key wrap iv and tag
    Base64Url encoded_header(parts[0]);
    auto final_header = JweHeader::parse(encoded_header);
    REQUIRE(final_header.iv().has_value());
    REQUIRE(final_header.authTag().has_value());

    auto cek = aes_gcm::decrypt(kek, final_header.iv()->decode(),
                                base64UrlDecode(parts[1]),
                                std::vector<uint8_t>{},
                                final_header.authTag()->decode(), ctx);
    REQUIRE(cek.size() == 16);

    auto content = aes_gcm::decrypt(
        cek, base64UrlDecode(parts[2]), base64UrlDecode(parts[3]),
        aad::compute(encoded_header), base64UrlDecode(parts[4]), ctx);
    CHECK(std::string(content.begin(), content.end()) == kMessage);

    // The header as it was before key wrapping does not authenticate
    REQUIRE_THROWS_AS(
        aes_gcm::decrypt(cek, base64UrlDecode(parts[2]),
                         base64UrlDecode(parts[3]), aad::compute(header),
                         base64UrlDecode(parts[4]), ctx),
        DecryptionError);
}

TEST_CASE("JWE: Characters outside the base64url alphabet") {
    KeyManagement km = AesKeyWrapManagement(sequentialKey(16));
    auto parts = splitParts(encryptCompact(
        km,
        JweHeader::Builder(JweAlgorithm::A128KW, EncryptionMethod::A128GCM)
            .build(),
        kMessage));

    for (size_t index : {1, 2, 3, 4}) {
        CAPTURE(index);
        auto corrupted = parts;
        corrupted[index] = corruptCharacter(parts[index]);
        try {
            JweObject::parse(joinParts(corrupted));
            FAIL("expected MalformedInputError");
        } catch (const MalformedInputError& e) {
            CHECK(e.errorCode() == JoseErrorCode::MALFORMED_INPUT);
        }
    }

    JweDecrypter decrypter{km};
    auto parsed = JweObject::parse(joinParts(parts));
    REQUIRE_THROWS_AS(
        decrypter.decrypt(parsed.header(), parsed.encryptedKey(), parsed.iv(),
                          Base64Url(corruptCharacter(parts[3])),
                          parsed.authTag()),
        DecryptionError);
    REQUIRE_THROWS_AS(
        decrypter.decrypt(parsed.header(),
                          Base64Url(corruptCharacter(parts[1])), parsed.iv(),
                          parsed.cipherText(), parsed.authTag()),
        DecryptionError);
}

TEST_CASE("JWE: Invalid base64url inside key management header parameters") {
    auto km = strategyFor(JweAlgorithm::PBES2_HS256_A128KW);
    auto parts = splitParts(encryptCompact(
        km,
        JweHeader::Builder(JweAlgorithm::PBES2_HS256_A128KW,
                           EncryptionMethod::A128GCM)
            .build(),
        kMessage));
    parts[0] = replaceHeader(parts[0], [](JweHeader::Builder& b) {
        b.pbes2Salt(Base64Url(std::string("c2Fs+dA")));
    });
    REQUIRE_THROWS_AS(decryptCompact(km, joinParts(parts)), DecryptionError);

    auto gcm = strategyFor(JweAlgorithm::A128GCMKW);
    auto gcm_parts = splitParts(encryptCompact(
        gcm,
        JweHeader::Builder(JweAlgorithm::A128GCMKW, EncryptionMethod::A128GCM)
            .build(),
        kMessage));
    gcm_parts[0] = replaceHeader(gcm_parts[0], [](JweHeader::Builder& b) {
        b.iv(Base64Url(std::string("aXZp+XZpdml2aXZp")));
    });
    REQUIRE_THROWS_AS(decryptCompact(gcm, joinParts(gcm_parts)),
                      DecryptionError);
}
