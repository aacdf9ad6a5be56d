#include "settings_store.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace common {

SettingsStore::SettingsStore(std::filesystem::path file) : file_(std::move(file)) {}

std::filesystem::path SettingsStore::userDataDirectory(const std::string& app_name) {
  const char* home_env = std::getenv("HOME");
  std::filesystem::path home = home_env ? home_env : ".";
#ifdef __APPLE__
  return home / "Library" / "Application Support" / app_name;
#else
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg != nullptr && *xdg != '\0') {
    return std::filesystem::path(xdg) / app_name;
  }
  return home / ".config" / app_name;
#endif
}

SettingsStore SettingsStore::forApplication(const std::string& app_name) {
  return SettingsStore(userDataDirectory(app_name) / "settings.json");
}

nlohmann::json SettingsStore::load() const {
  std::ifstream in(file_);
  if (!in) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    std::cerr << "[settings] Ignoring unreadable " << file_ << std::endl;
    return nlohmann::json::object();
  }
  return parsed;
}

bool SettingsStore::save(const nlohmann::json& settings) const {
  std::error_code ec;
  std::filesystem::create_directories(file_.parent_path(), ec);
  if (ec) {
    return false;
  }
  std::ofstream out(file_, std::ios::trunc);
  if (!out) {
    return false;
  }
  out << settings.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  return static_cast<bool>(out);
}

} // namespace common
