#pragma once

#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include "application/download_orchestrator.hpp"
#include "common/config/config.hpp"
#include "domain/download.hpp"
#include "domain/extraction_engine.hpp"
#include "domain/media.hpp"

namespace download_service {

inline constexpr std::array<std::string_view, 4> kAllowedContainers = {"mp4", "webm", "m4a", "mp3"};

bool isAllowedContainer(std::string_view ext);

// Request-scoped operations behind the HTTP endpoints. Holds no per-request
// state, so concurrent calls never interact.
class MediaService {
public:
  MediaService(std::shared_ptr<ExtractionEngine> engine,
               std::shared_ptr<DownloadOrchestrator> orchestrator,
               config::StorageConfig storage);

  // Metadata only; formats outside the container allow-list are dropped and an
  // empty list is an error.
  std::expected<MediaInfo, DownloadError> getInfo(const std::string& url);

  // Blocks until the file is ready. On success the result owns the scratch
  // directory; whoever holds the result last deletes it.
  DownloadResult downloadForStreaming(const std::string& url,
                                      const std::optional<std::string>& format_id,
                                      std::stop_token stop_token = {});

private:
  std::shared_ptr<ExtractionEngine> engine_;
  std::shared_ptr<DownloadOrchestrator> orchestrator_;
  config::StorageConfig storage_;
};

}
