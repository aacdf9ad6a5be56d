#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "domain/extraction_engine.hpp"
#include "domain/media.hpp"

namespace download_service {

// Line prefixes requested from yt-dlp through --progress-template/--print.
inline constexpr std::string_view kProgressTag = "[progress]";
inline constexpr std::string_view kPostprocessTag = "[postprocess]";
inline constexpr std::string_view kResultTag = "[result]";

MediaInfo parseMediaInfo(const nlohmann::json& info);
FormatInfo parseFormat(const nlohmann::json& format);
RawProgress parseProgress(const nlohmann::json& progress);

// Consumes the merged stdout/stderr of a download run line by line.
class FetchOutputReader {
public:
  explicit FetchOutputReader(ExtractionEngine::ProgressHook hook);

  void consume(std::string_view line);

  bool hasResult() const { return has_result_; }
  const FetchResult& result() const { return result_; }
  // The last "ERROR:" line, or the last untagged line when there was none.
  std::string errorMessage() const;

private:
  ExtractionEngine::ProgressHook hook_;
  FetchResult result_;
  bool has_result_{false};
  std::string last_error_;
  std::string last_line_;
};

// Info output may be preceded by stray lines; the document is the first line
// that opens a JSON object.
std::optional<nlohmann::json> findJsonDocument(std::string_view output);
std::string extractErrorMessage(std::string_view output);

}
