#pragma once
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include "media.hpp"

namespace download_service {

// The external extractor/downloader. Everything site-specific happens behind
// this interface.
class ExtractionEngine {
public:
  using ProgressHook = std::function<void(const RawProgress&)>;

  virtual ~ExtractionEngine() = default;

  virtual std::expected<MediaInfo, std::string> extractInfo(const std::string& url) = 0;

  // output_template is a path whose file name may contain engine fields such
  // as %(title)s. The hook is invoked on the calling thread.
  virtual std::expected<FetchResult, std::string> fetch(
    const std::string& url,
    const std::filesystem::path& output_template,
    const FetchOptions& options,
    ProgressHook progress_hook,
    std::stop_token stop_token
  ) = 0;
};

}
