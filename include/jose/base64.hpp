/**
 * @file base64.hpp
 * @brief Base64URL (RFC 4648 section 5, unpadded) codec and value type
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace jose {

std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Encode bytes as unpadded base64url
 */
template <Base64Data T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Decode a base64url string
 *
 * Trailing '=' padding is tolerated. Characters outside the URL-safe
 * alphabet and lengths that cannot come from an encoder are rejected.
 *
 * @throws InvalidBase64Error on malformed input
 */
std::vector<uint8_t> base64UrlDecode(std::string_view encoded);

/**
 * @brief A base64url encoded value, kept in its encoded form
 *
 * Compact JOSE parts are carried as Base64Url so the exact received text can
 * be reproduced and authenticated. Decoding happens on demand.
 */
class Base64Url {
 public:
  Base64Url() = default;

  explicit Base64Url(std::string encoded) : encoded_(std::move(encoded)) {}

  static Base64Url encode(std::span<const uint8_t> bytes) {
    return Base64Url(base64UrlEncodeImpl(bytes));
  }

  static Base64Url encode(std::string_view text) {
    return encode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
  }

  [[nodiscard]] const std::string& str() const noexcept { return encoded_; }

  [[nodiscard]] bool empty() const noexcept { return encoded_.empty(); }

  [[nodiscard]] std::vector<uint8_t> decode() const {
    return base64UrlDecode(encoded_);
  }

  /// Decoded bytes interpreted as UTF-8 text
  [[nodiscard]] std::string decodeToString() const {
    auto bytes = decode();
    return std::string(bytes.begin(), bytes.end());
  }

  bool operator==(const Base64Url& other) const = default;

 private:
  std::string encoded_;
};

/**
 * @brief Split a compact serialization on '.'
 *
 * Empty segments are kept, so "a..c" yields three parts.
 */
std::vector<Base64Url> splitCompact(std::string_view serialized);

}  // namespace jose
