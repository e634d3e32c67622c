#pragma once

#include <string>
#include <cstddef>
#include <string_view>

namespace poz::util {

/**
 * @brief Helpers for handling credentials
 */
class Security {
public:
  /**
   * @brief Mask sensitive information for display or logging
   * @param sensitive The sensitive string to mask
   * @param reveal_chars Number of characters to reveal at start and end
   * @return Masked string
   */
  static std::string maskSensitive(const std::string& sensitive, size_t reveal_chars = 4);

  /**
   * @brief Standard base64 (RFC 4648) with padding, as used by HTTP Basic auth
   */
  static std::string base64Encode(std::string_view data);

  /**
   * @brief Build the value of an HTTP Basic Authorization header
   * @return "Basic <base64(username:password)>"
   */
  static std::string basicAuthorization(const std::string& username, const std::string& password);

private:
  Security() = default;
};

} // namespace poz::util
