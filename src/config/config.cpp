#include "config/config.hpp"
#include <cstdlib>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace distore {
namespace config {

namespace pt = boost::property_tree;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Config::Config(const std::filesystem::path& file) : file_(file) {
  load();
}


//==============================================
// LOCATION
//==============================================

std::filesystem::path Config::default_directory() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return xdg;
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config";
  }
  throw ConfigError("Config directory could not be found, please specify one");
}

std::filesystem::path Config::file_in(const std::filesystem::path& directory) {
  return directory / "distore" / "distore.ini";
}


//==============================================
// LOOKUP
//==============================================

std::optional<std::string> Config::resolve(const std::string& key, const std::string& scope) const {
  if (auto value = scoped_value(key, scope)) {
    return value;
  }
  return global_value(key);
}

std::optional<std::string> Config::scoped_value(const std::string& key, const std::string& scope) const {
  check_key(key);
  // find() matches the section name literally, paths may contain '.'
  auto section = tree_.find(scope);
  if (section == tree_.not_found()) {
    return std::nullopt;
  }
  auto value = section->second.get_optional<std::string>(key);
  return value ? std::optional<std::string>(*value) : std::nullopt;
}

std::optional<std::string> Config::global_value(const std::string& key) const {
  check_key(key);
  auto entry = tree_.find(key);
  if (entry == tree_.not_found() || !entry->second.empty()) {
    return std::nullopt;
  }
  return entry->second.data();
}


//==============================================
// UPDATE
//==============================================

void Config::set(const std::string& key, const std::string& value,
                 const std::optional<std::string>& scope) {
  check_key(key);

  if (scope) {
    pt::ptree* section = nullptr;
    auto found = tree_.find(*scope);
    if (found == tree_.not_found()) {
      section = &tree_.push_back(pt::ptree::value_type(*scope, pt::ptree()))->second;
    } else {
      section = &found->second;
    }
    section->put(key, value);
    BOOST_LOG_TRIVIAL(info) << "Config: Set " << key << " for " << *scope;
  } else {
    auto entry = tree_.find(key);
    if (entry == tree_.not_found()) {
      tree_.push_front(pt::ptree::value_type(key, pt::ptree(value)));
    } else {
      entry->second.data() = value;
    }
    BOOST_LOG_TRIVIAL(info) << "Config: Set global " << key;
  }

  save();
}

bool Config::is_known_key(const std::string& key) {
  for (const auto& known : known_keys()) {
    if (known == key) {
      return true;
    }
  }
  return false;
}

const std::vector<std::string>& Config::known_keys() {
  static const std::vector<std::string> keys = {CONTAINER_KEY, STORE_KEY};
  return keys;
}


//==============================================
// PERSISTENCE
//==============================================

void Config::load() {
  if (!std::filesystem::exists(file_)) {
    BOOST_LOG_TRIVIAL(debug) << "Config: No config file at " << file_.string();
    return;
  }

  try {
    pt::read_ini(file_.string(), tree_);
    BOOST_LOG_TRIVIAL(debug) << "Config: Loaded " << file_.string();
  } catch (const pt::ini_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to parse " << file_.string() << ": " << e.what();
    throw ConfigError("Failed to read config file: " + std::string(e.what()));
  }
}

void Config::save() const {
  std::error_code ec;
  std::filesystem::create_directories(file_.parent_path(), ec);
  if (ec) {
    throw ConfigError("Failed to create config directory: " + ec.message());
  }

  try {
    pt::write_ini(file_.string(), tree_);
  } catch (const pt::ini_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to write " << file_.string() << ": " << e.what();
    throw ConfigError("Failed to write config file: " + std::string(e.what()));
  }
}

void Config::check_key(const std::string& key) {
  if (!is_known_key(key)) {
    throw ConfigError("Invalid key: " + key + " (possible keys: container, store)");
  }
}

} // namespace config
} // namespace distore
