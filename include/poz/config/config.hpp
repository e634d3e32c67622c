#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "poz/common.hpp"

namespace poz::config {

// Connection and credential settings for one invocation
class Config {
 public:
  // Looks up an environment variable; nullopt when unset
  using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

  static constexpr const char* kDefaultWorkspace = "Poznote";
  static constexpr const char* kDefaultUserId = "1";
  static constexpr std::chrono::seconds kDefaultTimeout{10};

  // Configuration keys
  static constexpr const char* kUrlKey = "POZNOTE_URL";
  static constexpr const char* kUserKey = "POZNOTE_USER";
  static constexpr const char* kPassKey = "POZNOTE_PASS";
  static constexpr const char* kUserIdKey = "POZNOTE_USER_ID";
  static constexpr const char* kWorkspaceKey = "POZNOTE_WORKSPACE";
  static constexpr const char* kAdvancedKey = "POZNOTE_ADVANCED_FEATURES";
  static constexpr const char* kTimeoutKey = "POZNOTE_TIMEOUT";

  std::string base_url;        // without trailing slash
  std::string username;
  std::string password;
  std::string user_id = kDefaultUserId;
  std::string workspace = kDefaultWorkspace;
  bool advanced_features_enabled = false;
  std::chrono::seconds request_timeout = kDefaultTimeout;

  // File the settings were read from, used in error messages
  std::filesystem::path source_path;

  /**
   * Load settings from a key/value file, let environment variables override
   * them, then validate. A missing file is tolerated; missing credentials
   * are not (kMissingCredentials).
   */
  static Result<Config> resolve(const std::filesystem::path& config_path,
                                const EnvLookup& env = processEnv());

  // Validate loaded values
  Result<void> validate() const;

  // Only "true" (any case) enables advanced features
  static bool parseAdvancedFlag(const std::optional<std::string>& value);

  // ~/.poznote.conf
  static std::filesystem::path defaultConfigPath();

  // Environment lookup backed by std::getenv
  static EnvLookup processEnv();
};

/**
 * Rewrite dotenv-style lines (`export KEY=value`, unquoted values, inline
 * `# comments`) as TOML `KEY = "value"` pairs. Quoted values, comments and
 * lines that are not assignments are kept as they are.
 */
std::string normalizeDotenv(std::string_view text);

}  // namespace poz::config
