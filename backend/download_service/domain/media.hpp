#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace download_service {

struct FormatInfo {
  std::string format_id;
  std::string ext;                        // container like "mp4", "webm", "m4a"
  std::optional<std::string> resolution;  // "1920x1080" or "audio only"
  std::optional<double> abr;              // audio bitrate, kbit/s
  std::optional<std::string> vcodec;
  std::optional<std::string> acodec;
  std::optional<std::int64_t> filesize;   // exact size, else the engine's estimate
  std::optional<std::string> format_note;
};

struct MediaInfo {
  std::string id;
  std::string title;
  std::optional<double> duration;
  std::string thumbnail;
  std::string uploader;
  std::string webpage_url;
  std::vector<FormatInfo> formats;
};

// One progress report as the engine produces it, before normalization.
struct RawProgress {
  std::string status;
  std::optional<double> downloaded_bytes;
  std::optional<double> total_bytes;
  std::optional<double> total_bytes_estimate;
  std::optional<std::string> percent_str;
  std::optional<std::string> speed_str;
};

struct AcceleratorOptions {
  std::string program;
  std::vector<std::string> args;
};

struct FetchOptions {
  std::optional<std::string> format_id;
  std::optional<AcceleratorOptions> accelerator;
  int concurrent_fragments{4};
  std::string merge_output_format{"mp4"};
};

struct FetchResult {
  std::vector<std::filesystem::path> output_paths;
  std::string title;
  std::string ext;
};

} // namespace download_service
