#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/property_tree/ptree.hpp>

namespace distore {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Two-level key/value settings kept in an INI file. Global values sit at the
// top level; values scoped to a working directory live in a section named
// after that directory's path.
class Config {
public:
  static constexpr const char* CONTAINER_KEY = "container";
  static constexpr const char* STORE_KEY = "store";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Loads the file if it exists, an absent file is an empty configuration
  explicit Config(const std::filesystem::path& file);


  // ---- LOCATION ----
  // $XDG_CONFIG_HOME, else $HOME/.config
  static std::filesystem::path default_directory();
  // <directory>/distore/distore.ini
  static std::filesystem::path file_in(const std::filesystem::path& directory);


  // ---- LOOKUP ----
  // Scoped value for the directory, falling back to the global value
  std::optional<std::string> resolve(const std::string& key, const std::string& scope) const;
  std::optional<std::string> scoped_value(const std::string& key, const std::string& scope) const;
  std::optional<std::string> global_value(const std::string& key) const;


  // ---- UPDATE ----
  // Sets a global value, or one scoped to the given directory, and saves the file
  void set(const std::string& key, const std::string& value,
           const std::optional<std::string>& scope = std::nullopt);

  static bool is_known_key(const std::string& key);
  static const std::vector<std::string>& known_keys();
  const std::filesystem::path& path() const { return file_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path file_;
  boost::property_tree::ptree tree_;

  void load();
  void save() const;
  static void check_key(const std::string& key);
};

} // namespace config
} // namespace distore
