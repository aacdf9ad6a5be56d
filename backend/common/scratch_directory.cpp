#include "scratch_directory.hpp"
#include <iostream>
#include <system_error>
#include <uuid/uuid.h>

namespace common {

namespace {

std::string generateUuid() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

} // namespace

std::expected<ScratchDirectory, std::string> ScratchDirectory::create(
  const std::filesystem::path& parent,
  const std::string& prefix
) {
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    return std::unexpected("Failed to create scratch root " + parent.string() + ": " + ec.message());
  }

  // create_directory reports false for an existing entry, so a collision
  // simply draws another uuid
  for (int attempt = 0; attempt < 8; ++attempt) {
    auto candidate = parent / (prefix + generateUuid());
    if (std::filesystem::create_directory(candidate, ec)) {
      return ScratchDirectory(std::move(candidate));
    }
    if (ec) {
      return std::unexpected("Failed to create scratch directory " + candidate.string() + ": " + ec.message());
    }
  }
  return std::unexpected("Failed to allocate a unique scratch directory under " + parent.string());
}

ScratchDirectory::ScratchDirectory(std::filesystem::path path) : path_(std::move(path)) {}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
  : path_(std::move(other.path_)), removed_(other.removed_) {
  other.removed_ = true;
}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    removed_ = other.removed_;
    other.removed_ = true;
  }
  return *this;
}

ScratchDirectory::~ScratchDirectory() {
  remove();
}

bool ScratchDirectory::contains(const std::filesystem::path& candidate) const {
  auto relative = candidate.lexically_normal().lexically_relative(path_.lexically_normal());
  if (relative.empty()) {
    return false;
  }
  auto first = *relative.begin();
  return first != ".." && first != ".";
}

bool ScratchDirectory::remove() {
  if (removed_) {
    return true;
  }
  removed_ = true;

  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    std::cerr << "[scratch] Failed to remove " << path_ << ": " << ec.message() << std::endl;
    return false;
  }
  return true;
}

} // namespace common
