#pragma once

#include <filesystem>
#include <string>

namespace snip::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/snip)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/snip)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get database file path
  static std::filesystem::path databaseFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace snip::util
