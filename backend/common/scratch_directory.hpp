#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace common {

// Private temporary directory owned by exactly one request. The directory and
// everything inside it are removed when the owner is destroyed or remove() is
// called, whichever comes first.
class ScratchDirectory {
public:
  static std::expected<ScratchDirectory, std::string> create(
    const std::filesystem::path& parent,
    const std::string& prefix
  );

  ScratchDirectory(ScratchDirectory&& other) noexcept;
  ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;
  ScratchDirectory(const ScratchDirectory&) = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;
  ~ScratchDirectory();

  const std::filesystem::path& path() const { return path_; }
  bool contains(const std::filesystem::path& candidate) const;

  // Idempotent; returns false when something could not be deleted.
  bool remove();

private:
  explicit ScratchDirectory(std::filesystem::path path);

  std::filesystem::path path_;
  bool removed_{false};
};

} // namespace common
