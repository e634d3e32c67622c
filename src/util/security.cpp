#include "poz/util/security.hpp"

#include <algorithm>
#include <cstdint>

namespace poz::util {

std::string Security::maskSensitive(const std::string& sensitive, size_t reveal_chars) {
  if (sensitive.empty()) {
    return "[empty]";
  }

  if (sensitive.length() <= reveal_chars * 2) {
    // If string is too short, just show asterisks
    return std::string(std::min(sensitive.length(), size_t(8)), '*');
  }

  std::string masked;
  masked.reserve(sensitive.length());

  // Show first few characters
  masked.append(sensitive.substr(0, reveal_chars));

  // Add asterisks for middle part
  size_t middle_length = sensitive.length() - (reveal_chars * 2);
  masked.append(std::string(std::min(middle_length, size_t(12)), '*'));

  // Show last few characters
  masked.append(sensitive.substr(sensitive.length() - reveal_chars));

  return masked;
}

std::string Security::base64Encode(std::string_view data) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string encoded;
  encoded.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  while (i + 3 <= data.size()) {
    uint32_t chunk = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8) |
                     static_cast<uint8_t>(data[i + 2]);
    encoded += kAlphabet[(chunk >> 18) & 0x3F];
    encoded += kAlphabet[(chunk >> 12) & 0x3F];
    encoded += kAlphabet[(chunk >> 6) & 0x3F];
    encoded += kAlphabet[chunk & 0x3F];
    i += 3;
  }

  size_t remaining = data.size() - i;
  if (remaining == 1) {
    uint32_t chunk = static_cast<uint8_t>(data[i]) << 16;
    encoded += kAlphabet[(chunk >> 18) & 0x3F];
    encoded += kAlphabet[(chunk >> 12) & 0x3F];
    encoded += "==";
  } else if (remaining == 2) {
    uint32_t chunk = (static_cast<uint8_t>(data[i]) << 16) |
                     (static_cast<uint8_t>(data[i + 1]) << 8);
    encoded += kAlphabet[(chunk >> 18) & 0x3F];
    encoded += kAlphabet[(chunk >> 12) & 0x3F];
    encoded += kAlphabet[(chunk >> 6) & 0x3F];
    encoded += '=';
  }

  return encoded;
}

std::string Security::basicAuthorization(const std::string& username, const std::string& password) {
  return "Basic " + base64Encode(username + ":" + password);
}

} // namespace poz::util
