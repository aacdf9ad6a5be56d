#include "executable_locator.hpp"
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace download_service {

namespace {

bool isExecutableFile(const std::filesystem::path& candidate) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(candidate, ec)) {
    return false;
  }
  return ::access(candidate.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::filesystem::path> findExecutable(const std::string& name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (isExecutableFile(name)) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }

  std::string_view remaining(path_env);
  while (true) {
    auto sep = remaining.find(':');
    auto entry = remaining.substr(0, sep);
    // an empty entry means the current directory
    std::filesystem::path dir = entry.empty() ? std::filesystem::path(".") : std::filesystem::path(entry);
    auto candidate = dir / name;
    if (isExecutableFile(candidate)) {
      return candidate;
    }
    if (sep == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(sep + 1);
  }
  return std::nullopt;
}

}
