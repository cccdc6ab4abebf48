/**
 * @file compression.hpp
 * @brief JWE "zip" handling: raw DEFLATE (RFC 1951) through zlib
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "header.hpp"

namespace jose {
namespace compression {

/// Default limit on decompressed output
constexpr size_t DEFAULT_MAX_INFLATED_SIZE = 10 * 1024 * 1024;

/// Raw DEFLATE stream, no zlib or gzip wrapper
std::vector<uint8_t> deflate(std::span<const uint8_t> data);

/**
 * @throws CryptoError if the input is not a complete raw DEFLATE stream or
 * expands beyond max_size bytes
 */
std::vector<uint8_t> inflate(std::span<const uint8_t> data,
                             size_t max_size = DEFAULT_MAX_INFLATED_SIZE);

/**
 * @brief Compress the plaintext if the header asks for it
 * @return The input unchanged when the header has no "zip"
 */
std::vector<uint8_t> compress(const JweHeader& header,
                              std::span<const uint8_t> plaintext);

std::vector<uint8_t> decompress(const JweHeader& header,
                                std::span<const uint8_t> data,
                                size_t max_size = DEFAULT_MAX_INFLATED_SIZE);

}  // namespace compression
}  // namespace jose
