/**
 * @file base64.hpp
 * @brief Base64 and hex helpers for signatures, keys and digests
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace trustchain {

std::string base64EncodeImpl(std::span<const uint8_t> data);

std::string hexEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for byte containers accepted by the encoders
 */
template <typename T>
concept ByteData = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Encode bytes as standard (RFC 4648 section 4) padded base64
 */
template <ByteData T>
std::string base64Encode(const T& data) {
  return base64EncodeImpl({std::data(data), std::size(data)});
}

/**
 * @brief Decode standard base64; padding is optional
 * @throws InvalidBase64Error on characters outside the alphabet
 */
std::vector<uint8_t> base64Decode(std::string_view data);

/**
 * @brief Lowercase hex encoding
 */
template <ByteData T>
std::string hexEncode(const T& data) {
  return hexEncodeImpl({std::data(data), std::size(data)});
}

}  // namespace trustchain
