#include <doctest/doctest.h>
#include "jose/algorithm.hpp"
#include "jose/error.hpp"
#include <string>
#include <vector>

using namespace jose;

TEST_CASE("AlgorithmNames") {
    CHECK(name(JweAlgorithm::DIR) == "dir");
    CHECK(name(JweAlgorithm::RSA_OAEP_256) == "RSA-OAEP-256");
    CHECK(name(JweAlgorithm::ECDH_ES_A192KW) == "ECDH-ES+A192KW");
    CHECK(name(JweAlgorithm::PBES2_HS512_A256KW) == "PBES2-HS512+A256KW");
    CHECK(name(EncryptionMethod::A128CBC_HS256) == "A128CBC-HS256");
    CHECK(name(EncryptionMethod::A256CBC_HS512_LEGACY) == "A256CBC+HS512");
    CHECK(name(JwsAlgorithm::PS384) == "PS384");
    CHECK(name(CompressionAlgorithm::DEF) == "DEF");
}

TEST_CASE("AlgorithmLookupByName") {
    for (auto alg : {JweAlgorithm::RSA1_5, JweAlgorithm::A192GCMKW,
                     JweAlgorithm::ECDH_ES, JweAlgorithm::PBES2_HS256_A128KW}) {
        CHECK(jweAlgorithmFromName(name(alg)) == alg);
    }
    for (auto enc : algorithms::ALL_ENC) {
        CHECK(encryptionMethodFromName(name(enc)) == enc);
    }
    for (auto alg : algorithms::ECDSA) {
        CHECK(jwsAlgorithmFromName(name(alg)) == alg);
    }

    CHECK_FALSE(jweAlgorithmFromName("DIR").has_value());
    CHECK_FALSE(encryptionMethodFromName("A128CBC").has_value());
    CHECK_FALSE(jwsAlgorithmFromName("none").has_value());
    CHECK_FALSE(compressionFromName("GZIP").has_value());
}

TEST_CASE("EncryptionMethodInfo") {
    CHECK(cekByteLength(EncryptionMethod::A128GCM) == 16);
    CHECK(cekByteLength(EncryptionMethod::A192GCM) == 24);
    CHECK(cekByteLength(EncryptionMethod::A128CBC_HS256) == 32);
    CHECK(cekByteLength(EncryptionMethod::A192CBC_HS384) == 48);
    CHECK(cekByteLength(EncryptionMethod::A256CBC_HS512) == 64);
    CHECK(cekByteLength(EncryptionMethod::A128CBC_HS256_LEGACY) == 32);

    const auto& info = methodInfo(EncryptionMethod::A192CBC_HS384);
    CHECK(info.family == ContentFamily::AES_CBC_HMAC);
    CHECK(info.tagLength == 24);
    CHECK(info.digest == "SHA384");

    CHECK(methodInfo(EncryptionMethod::A256GCM).family ==
          ContentFamily::AES_GCM);
    CHECK(methodInfo(EncryptionMethod::A256CBC_HS512_LEGACY).family ==
          ContentFamily::AES_CBC_HMAC_LEGACY);
}

TEST_CASE("Itemize") {
    CHECK(itemize(std::vector<std::string_view>{}) == "");
    CHECK(itemize(std::vector<std::string_view>{"A"}) == "A");
    CHECK(itemize(std::vector<std::string_view>{"A", "B"}) == "A or B");
    CHECK(itemize(std::vector<std::string_view>{"A", "B", "C"}) ==
          "A, B or C");
}

TEST_CASE("UnsupportedAlgorithmMessages") {
    CHECK(unsupportedJweAlgorithm("RSA1_5", algorithms::AES_KW) ==
          "Unsupported JWE algorithm RSA1_5, must be A128KW, A192KW or A256KW");
    CHECK(unsupportedJwsAlgorithm("HS256", algorithms::ECDSA) ==
          "Unsupported JWS algorithm HS256, must be ES256, ES384 or ES512");
    CHECK(unsupportedEncryptionMethod(
              "A128GCM", std::span<const EncryptionMethod>(
                             algorithms::ALL_ENC, 1)) ==
          "Unsupported JWE encryption method A128GCM, must be A128CBC-HS256");

    UnsupportedAlgorithmError error(
        unsupportedJweAlgorithm("dir", algorithms::DIRECT));
    CHECK(std::string(error.what()).find("must be dir") != std::string::npos);
    CHECK(error.errorCode() == JoseErrorCode::UNSUPPORTED_ALGORITHM);
}
