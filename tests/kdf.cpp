#include <doctest/doctest.h>
#include "jose/kdf.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <optional>

using namespace jose;
using test_helpers::fromHex;
using test_helpers::toHex;

TEST_CASE("ConcatKdfEncoding") {
    CHECK(concat_kdf::encodeNoData().empty());
    CHECK(toHex(concat_kdf::encodeIntData(128)) == "00000080");
    CHECK(toHex(concat_kdf::encodeStringData("Bob")) == "00000003426f62");
    CHECK(toHex(concat_kdf::encodeStringData("")) == "00000000");

    std::vector<uint8_t> data = {0xAA, 0xBB};
    CHECK(toHex(concat_kdf::encodeDataWithLength(data)) == "00000002aabb");
}

TEST_CASE("ConcatKdfDigestCycles") {
    CHECK(concat_kdf::computeDigestCycles(256, 128) == 1);
    CHECK(concat_kdf::computeDigestCycles(256, 256) == 1);
    CHECK(concat_kdf::computeDigestCycles(256, 384) == 2);
    CHECK(concat_kdf::computeDigestCycles(256, 512) == 2);
    CHECK(concat_kdf::computeDigestCycles(256, 520) == 3);
}

TEST_CASE("ConcatKdfRfc7518AppendixC") {
    auto other_info = concat_kdf::composeOtherInfo(
        concat_kdf::encodeStringData("A128GCM"),
        concat_kdf::encodeStringData("Alice"),
        concat_kdf::encodeStringData("Bob"), concat_kdf::encodeIntData(128),
        concat_kdf::encodeNoData());
    CHECK(toHex(other_info) ==
          "000000074131323847434d00000005416c69636500000003426f6200000080");

    auto z = fromHex(
        "9e56d91d817135d372834283bf84269cfb316ea3da806a48f6daa7798cfe90c4");
    auto key = concat_kdf::deriveKey(z, 128, other_info, "SHA256",
                                     CryptoContext::defaultContext());
    CHECK(toHex(key) == "56aa8deaf8236d205c2228cd71a7101a");
}

TEST_CASE("ConcatKdfLongOutput") {
    auto z = fromHex(
        "9e56d91d817135d372834283bf84269cfb316ea3da806a48f6daa7798cfe90c4");
    auto other_info = concat_kdf::encodeIntData(512);
    auto key = concat_kdf::deriveKey(z, 512, other_info, "SHA256",
                                     CryptoContext::defaultContext());
    CHECK(key.size() == 64);

    auto prefix = concat_kdf::deriveKey(z, 256, other_info, "SHA256",
                                        CryptoContext::defaultContext());
    CHECK(std::equal(prefix.begin(), prefix.end(), key.begin()));
}

TEST_CASE("LegacyKdfDraft08") {
    auto cmk = fromHex(
        "04d31fc5549dfcfe0b649dfa3faa6ace6b7cd42d6f6b09dbc8b100f08f9c2ccf");
    const auto& ctx = CryptoContext::defaultContext();

    auto cek = legacy_kdf::generateCek(
        cmk, EncryptionMethod::A128CBC_HS256_LEGACY, std::nullopt,
        std::nullopt, ctx);
    CHECK(toHex(cek) == "cba5b4713ec316625b99d2267023e6ec");

    auto cik = legacy_kdf::generateCik(
        cmk, EncryptionMethod::A128CBC_HS256_LEGACY, std::nullopt,
        std::nullopt, ctx);
    CHECK(toHex(cik) ==
          "da18a011a032eb23d8d164ae9ba30a75b46facc87fc9cead282d3aaa235d093c");
}

TEST_CASE("LegacyKdfPartyInfoChangesKeys") {
    auto cmk = fromHex(
        "04d31fc5549dfcfe0b649dfa3faa6ace6b7cd42d6f6b09dbc8b100f08f9c2ccf");
    const auto& ctx = CryptoContext::defaultContext();
    std::optional<std::vector<uint8_t>> epu = std::vector<uint8_t>{1, 2, 3};

    auto plain = legacy_kdf::generateCek(
        cmk, EncryptionMethod::A128CBC_HS256_LEGACY, std::nullopt,
        std::nullopt, ctx);
    auto with_epu = legacy_kdf::generateCek(
        cmk, EncryptionMethod::A128CBC_HS256_LEGACY, epu, std::nullopt, ctx);
    CHECK(plain != with_epu);
}
