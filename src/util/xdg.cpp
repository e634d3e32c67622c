#include "poz/util/xdg.hpp"

#include <cstdlib>
#include <filesystem>

namespace poz::util {

std::filesystem::path Xdg::homeDir() {
  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path();
  }
  return std::filesystem::path(home);
}

std::filesystem::path Xdg::configFile() {
  // Dotfile in $HOME, not under XDG_CONFIG_HOME
  return homeDir() / ".poznote.conf";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace poz::util
