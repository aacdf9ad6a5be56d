#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace download_service {

// PATH lookup in the manner of `which`. Names containing a slash are checked
// as given.
std::optional<std::filesystem::path> findExecutable(const std::string& name);

}
