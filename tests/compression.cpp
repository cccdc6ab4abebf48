#include <doctest/doctest.h>
#include "jose/compression.hpp"
#include "jose/error.hpp"
#include "test_helpers.hpp"
#include <string>

using namespace jose;
using test_helpers::fromHex;

namespace {

std::vector<uint8_t> bytesOf(const std::string& text) {
    return {text.begin(), text.end()};
}

}  // namespace

TEST_CASE("DeflateRoundTrip") {
    std::string text;
    for (int i = 0; i < 200; ++i) text += "You can trust us to stick with you. ";
    auto data = bytesOf(text);

    auto compressed = compression::deflate(data);
    CHECK(compressed.size() < data.size());
    CHECK(compression::inflate(compressed) == data);

    auto empty = compression::deflate(std::vector<uint8_t>{});
    CHECK_FALSE(empty.empty());
    CHECK(compression::inflate(empty).empty());
}

TEST_CASE("InflateRawStream") {
    // Raw DEFLATE (no zlib header) as produced by other JOSE libraries
    auto stream = fromHex("cb48cdc9c957c8409000");
    auto inflated = compression::inflate(stream);
    CHECK(std::string(inflated.begin(), inflated.end()) == "hello hello hello");
}

TEST_CASE("InflateRejectsBadStreams") {
    auto stream = fromHex("cb48cdc9c957c8409000");
    stream.pop_back();
    stream.pop_back();
    REQUIRE_THROWS_AS(compression::inflate(stream), CryptoError);

    // zlib-wrapped data is not a raw stream
    auto wrapped = fromHex("789ccb48cdc9c957c8409000");
    REQUIRE_THROWS_AS(compression::inflate(wrapped), CryptoError);
}

TEST_CASE("CompressFollowsZipHeader") {
    auto data = bytesOf(std::string(512, 'a'));

    auto plain = JweHeader::Builder(JweAlgorithm::DIR, EncryptionMethod::A128GCM)
                     .build();
    CHECK(compression::compress(plain, data) == data);
    CHECK(compression::decompress(plain, data) == data);

    auto zipped = JweHeader::Builder(JweAlgorithm::DIR, EncryptionMethod::A128GCM)
                      .compression(CompressionAlgorithm::DEF)
                      .build();
    auto compressed = compression::compress(zipped, data);
    CHECK(compressed.size() < data.size());
    CHECK(compression::decompress(zipped, compressed) == data);
}

TEST_CASE("InflateStopsAtOutputLimit") {
    std::vector<uint8_t> zeros(1024 * 1024, 0);
    auto compressed = compression::deflate(zeros);
    CHECK(compressed.size() < 4096);

    REQUIRE_THROWS_AS(compression::inflate(compressed, 64 * 1024), CryptoError);
    CHECK(compression::inflate(compressed, zeros.size()) == zeros);
    REQUIRE_THROWS_AS(compression::inflate(compressed, zeros.size() - 1),
                      CryptoError);

    auto zipped = JweHeader::Builder(JweAlgorithm::DIR, EncryptionMethod::A128GCM)
                      .compression(CompressionAlgorithm::DEF)
                      .build();
    REQUIRE_THROWS_AS(compression::decompress(zipped, compressed, 1024),
                      CryptoError);
}
