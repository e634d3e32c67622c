#pragma once

#include <filesystem>
#include <string>

namespace poz::util {

// Home directory lookups
class Xdg {
 public:
  // Get the operator's home directory ($HOME, falling back to the working directory)
  static std::filesystem::path homeDir();

  // Get config file path (~/.poznote.conf)
  static std::filesystem::path configFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace poz::util
