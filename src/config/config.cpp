#include "poz/config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "poz/util/security.hpp"
#include "poz/util/xdg.hpp"

namespace poz::config {

namespace {

using Settings = std::unordered_map<std::string, std::string>;

// Every value reaches toml++ as a string
std::optional<std::string> scalarToString(const toml::node& node) {
  if (auto value = node.value<std::string>()) {
    return *value;
  }
  return std::nullopt;
}

bool isBareKey(std::string_view key) {
  return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
  });
}

std::string_view trimView(std::string_view text) {
  auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

// TOML basic string holding a raw dotenv value
std::string quoteValue(std::string_view value) {
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

}  // namespace

std::string normalizeDotenv(std::string_view text) {
  std::string normalized;
  size_t pos = 0;
  while (pos <= text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(pos, end - pos);
    pos = end + 1;

    auto content = trimView(line);
    if (content.starts_with("export ") || content.starts_with("export\t")) {
      content = trimView(content.substr(7));
    }

    auto eq = content.find('=');
    auto key = eq == std::string_view::npos ? std::string_view{} : trimView(content.substr(0, eq));
    if (content.empty() || content.front() == '#' || !isBareKey(key)) {
      normalized.append(line);
      normalized += '\n';
      continue;
    }

    auto value = trimView(content.substr(eq + 1));
    normalized.append(key);
    normalized += " = ";
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
      // Quoted values already follow TOML string rules
      normalized.append(value);
    } else {
      // Unquoted: everything up to an inline " #" comment is the value
      for (size_t i = 1; i < value.size(); ++i) {
        if (value[i] == '#' && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
          value = trimView(value.substr(0, i));
          break;
        }
      }
      normalized += quoteValue(value);
    }
    normalized += '\n';
  }
  return normalized;
}

namespace {

Result<Settings> loadFile(const std::filesystem::path& config_path) {
  Settings settings;
  std::error_code ec;
  if (!std::filesystem::exists(config_path, ec)) {
    spdlog::info("Config file not found: {}", config_path.string());
    return settings;
  }

  try {
    std::ifstream file(config_path);
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot read " + config_path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    // Files are dotenv-style KEY=value lines; toml++ parses the quoted form
    auto config_data = toml::parse(normalizeDotenv(buffer.str()), config_path.string());
    for (const auto& [key, node] : config_data) {
      auto value = scalarToString(node);
      if (!value.has_value()) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "Unsupported value for " + std::string(key.str()) +
                                         " in " + config_path.string()));
      }
      settings[std::string(key.str())] = *value;
    }
  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Failed to parse " + config_path.string() + ": " +
                                     std::string(e.description())));
  }

  return settings;
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool isBlank(const std::optional<std::string>& value) {
  return !value.has_value() ||
         std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

Result<Config> Config::resolve(const std::filesystem::path& config_path, const EnvLookup& env) {
  auto file_settings = loadFile(config_path);
  if (!file_settings.has_value()) {
    return std::unexpected(file_settings.error());
  }

  // Environment wins over the file
  auto lookup = [&](const std::string& key) -> std::optional<std::string> {
    if (env) {
      if (auto value = env(key)) {
        return value;
      }
    }
    auto it = file_settings->find(key);
    if (it != file_settings->end()) {
      return it->second;
    }
    return std::nullopt;
  };

  Config config;
  config.source_path = config_path;

  auto url = lookup(kUrlKey);
  auto user = lookup(kUserKey);
  auto pass = lookup(kPassKey);
  if (isBlank(url) || isBlank(user) || !pass.has_value() || pass->empty()) {
    return std::unexpected(makeError(ErrorCode::kMissingCredentials,
                                     "Credentials missing in " + config_path.string()));
  }

  config.base_url = *url;
  while (!config.base_url.empty() && config.base_url.back() == '/') {
    config.base_url.pop_back();
  }
  config.username = *user;
  config.password = *pass;

  if (auto value = lookup(kUserIdKey); !isBlank(value)) {
    config.user_id = *value;
  }
  if (auto value = lookup(kWorkspaceKey); !isBlank(value)) {
    config.workspace = *value;
  }
  config.advanced_features_enabled = parseAdvancedFlag(lookup(kAdvancedKey));

  if (auto value = lookup(kTimeoutKey); !isBlank(value)) {
    const std::string& text = *value;
    bool digits = std::all_of(text.begin(), text.end(),
                              [](unsigned char c) { return std::isdigit(c); });
    long seconds = digits && text.size() <= 6 ? std::strtol(text.c_str(), nullptr, 10) : 0;
    if (seconds <= 0) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       std::string(kTimeoutKey) + " must be a positive number of seconds, got '" +
                                       text + "'"));
    }
    config.request_timeout = std::chrono::seconds(seconds);
  }

  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  spdlog::debug("Loaded config from {}: url={} user={} password={} workspace={} advanced={}",
                config_path.string(), config.base_url, config.username,
                util::Security::maskSensitive(config.password), config.workspace,
                config.advanced_features_enabled);
  return config;
}

Result<void> Config::validate() const {
  if (username.empty() || password.empty()) {
    return std::unexpected(makeError(ErrorCode::kMissingCredentials,
                                     "Credentials missing in " + source_path.string()));
  }

  std::string_view url = base_url;
  std::string_view rest;
  if (url.starts_with("https://")) {
    rest = url.substr(8);
  } else if (url.starts_with("http://")) {
    rest = url.substr(7);
  } else {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     std::string(kUrlKey) + " must start with http:// or https://, got '" +
                                     base_url + "'"));
  }

  auto host = rest.substr(0, rest.find_first_of("/?#"));
  if (host.empty() || host.find_first_of(" \t\r\n") != std::string_view::npos) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     std::string(kUrlKey) + " has no valid host: '" + base_url + "'"));
  }
  if (rest.find_first_of("?#") != std::string_view::npos) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     std::string(kUrlKey) + " must not contain a query or fragment"));
  }

  return {};
}

bool Config::parseAdvancedFlag(const std::optional<std::string>& value) {
  if (!value.has_value()) {
    return false;
  }
  return toLower(*value) == "true";
}

std::filesystem::path Config::defaultConfigPath() {
  return poz::util::Xdg::configFile();
}

Config::EnvLookup Config::processEnv() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

}  // namespace poz::config
