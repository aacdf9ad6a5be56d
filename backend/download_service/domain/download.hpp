#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "common/scratch_directory.hpp"

namespace download_service {

struct DownloadRequest {
  std::string source_url;
  std::filesystem::path destination_directory;
  std::optional<std::string> format_selector;
  bool use_external_accelerator{false};
  // true: the scratch directory travels with the result and its holder
  // deletes it; false: the file is moved into destination_directory
  bool hand_off_output{false};
};

enum class Phase {
  Preparing,
  Downloading,
  Postprocessing,
  Finished,
  Failed
};

struct ProgressEvent {
  Phase phase{Phase::Preparing};
  std::optional<double> percent;
  std::string message;
};

enum class ErrorKind {
  Validation,
  Directory,
  AcceleratorUnavailable,
  Engine,
  OutputNotFound,
  Cancelled,
  Internal
};

const char* errorKindName(ErrorKind kind);

struct DownloadError {
  ErrorKind kind;
  std::string message;
};

struct DownloadResult {
  bool success{false};
  std::optional<std::filesystem::path> output_path;
  std::optional<DownloadError> error;
  std::shared_ptr<common::ScratchDirectory> scratch;

  static DownloadResult succeeded(std::filesystem::path path,
                                  std::shared_ptr<common::ScratchDirectory> scratch = nullptr) {
    return DownloadResult{true, std::move(path), std::nullopt, std::move(scratch)};
  }

  static DownloadResult failed(DownloadError error) {
    return DownloadResult{false, std::nullopt, std::move(error), nullptr};
  }
};

} // namespace download_service
