#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace common {

// settings.json under the per-user application directory. Reading never
// fails (missing or corrupt file yields an empty object); saving is best
// effort and reports success only for the caller's information.
class SettingsStore {
public:
  explicit SettingsStore(std::filesystem::path file);

  static std::filesystem::path userDataDirectory(const std::string& app_name);
  static SettingsStore forApplication(const std::string& app_name);

  nlohmann::json load() const;
  bool save(const nlohmann::json& settings) const;

  const std::filesystem::path& file() const { return file_; }

private:
  std::filesystem::path file_;
};

} // namespace common
