#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>
#include "common/config/config.hpp"
#include "domain/extraction_engine.hpp"

namespace download_service {

// Runs the yt-dlp executable as a child process, without a shell. Each call
// spawns its own process, so one instance serves any number of concurrent
// requests. A stop request terminates the child's whole process group.
class YtDlpEngine : public ExtractionEngine {
public:
  explicit YtDlpEngine(config::EngineConfig config);

  std::expected<MediaInfo, std::string> extractInfo(const std::string& url) override;

  std::expected<FetchResult, std::string> fetch(
    const std::string& url,
    const std::filesystem::path& output_template,
    const FetchOptions& options,
    ProgressHook progress_hook,
    std::stop_token stop_token
  ) override;

  std::vector<std::string> buildInfoArgs(const std::string& url) const;
  std::vector<std::string> buildFetchArgs(const std::string& url,
                                          const std::filesystem::path& output_template,
                                          const FetchOptions& options) const;

private:
  using LineHandler = std::function<void(std::string_view)>;

  std::vector<std::string> commonArgs() const;

  // Exit status of the child, or an error when it could not be started or
  // was abandoned because of a stop request.
  std::expected<int, std::string> runProcess(const std::vector<std::string>& args,
                                             const LineHandler& on_line,
                                             std::stop_token stop_token) const;

  config::EngineConfig config_;
};

}
