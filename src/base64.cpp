#include "trustchain/base64.hpp"

#include <array>

namespace trustchain {

static constexpr std::string_view base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64EncodeImpl(std::span<const uint8_t> data) {
  std::string result;
  result.reserve(((data.size() + 2) / 3) * 4);

  uint32_t val = 0;
  int valb = -6;
  for (uint8_t c : data) {
    val = ((val << 8) + c) & 0xFFFFFF;
    valb += 8;
    while (valb >= 0) {
      result.push_back(base64_chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    result.push_back(base64_chars[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (result.size() % 4 != 0) {
    result.push_back('=');
  }
  return result;
}

std::vector<uint8_t> base64Decode(std::string_view encoded) {
  static const std::array<int8_t, 256> decode_table = []() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (size_t i = 0; i < base64_chars.size(); ++i) {
      table[static_cast<unsigned char>(base64_chars[i])] =
          static_cast<int8_t>(i);
    }
    return table;
  }();

  std::vector<uint8_t> result;
  result.reserve((encoded.size() * 3) / 4);

  uint32_t val = 0;
  int valb = -8;
  for (size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '=') {
      // Only padding may follow
      for (size_t j = i; j < encoded.size(); ++j) {
        if (encoded[j] != '=') {
          throw InvalidBase64Error("data after padding");
        }
      }
      break;
    }

    int8_t decoded = decode_table[static_cast<unsigned char>(c)];
    if (decoded == -1) {
      throw InvalidBase64Error("Invalid character in base64 string");
    }

    val = ((val << 6) + static_cast<uint32_t>(decoded)) & 0xFFFFFF;
    valb += 6;
    if (valb >= 0) {
      result.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return result;
}

std::string hexEncodeImpl(std::span<const uint8_t> data) {
  static constexpr char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(hex[(b >> 4) & 0xF]);
    out.push_back(hex[b & 0xF]);
  }
  return out;
}

}  // namespace trustchain
