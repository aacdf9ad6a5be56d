#include "media_service.hpp"
#include <algorithm>

namespace download_service {

bool isAllowedContainer(std::string_view ext) {
  return std::find(kAllowedContainers.begin(), kAllowedContainers.end(), ext) != kAllowedContainers.end();
}

MediaService::MediaService(std::shared_ptr<ExtractionEngine> engine,
                           std::shared_ptr<DownloadOrchestrator> orchestrator,
                           config::StorageConfig storage)
  : engine_(std::move(engine)),
    orchestrator_(std::move(orchestrator)),
    storage_(std::move(storage)) {}

std::expected<MediaInfo, DownloadError> MediaService::getInfo(const std::string& url) {
  if (url.find_first_not_of(" \t\r\n") == std::string::npos) {
    return std::unexpected(DownloadError{ErrorKind::Validation, "Missing url"});
  }

  std::expected<MediaInfo, std::string> fetched_info;
  try {
    fetched_info = engine_->extractInfo(url);
  } catch (const std::exception& e) {
    return std::unexpected(DownloadError{ErrorKind::Engine, "Failed to fetch info: " + std::string(e.what())});
  }
  if (!fetched_info) {
    return std::unexpected(DownloadError{ErrorKind::Engine, "Failed to fetch info: " + fetched_info.error()});
  }

  auto info = std::move(*fetched_info);
  std::erase_if(info.formats, [](const FormatInfo& format) { return !isAllowedContainer(format.ext); });
  if (info.formats.empty()) {
    return std::unexpected(DownloadError{ErrorKind::Engine,
      "No downloadable formats found. Update yt-dlp, provide cookies (YTDLP_COOKIES) or try again later."});
  }
  return info;
}

DownloadResult MediaService::downloadForStreaming(const std::string& url,
                                                  const std::optional<std::string>& format_id,
                                                  std::stop_token stop_token) {
  DownloadRequest request;
  request.source_url = url;
  request.destination_directory = storage_.scratch_root;
  request.format_selector = format_id;
  request.use_external_accelerator = false;
  request.hand_off_output = true;
  return orchestrator_->run(request, {}, stop_token);
}

}
