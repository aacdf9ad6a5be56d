#include "ytdlp_output.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

namespace download_service {

namespace {

std::string jsonString(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

std::optional<std::string> jsonOptionalString(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::optional<double> jsonNumber(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  auto value = it->get<double>();
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

// Whole numbers only; floats are truncated, anything outside int64 is absent.
std::optional<std::int64_t> jsonInteger(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  if (it->is_number_float()) {
    auto value = it->get<double>();
    // 2^63 is exactly representable; the range is [-2^63, 2^63)
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || value < -kLimit || value >= kLimit) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
  }
  return std::nullopt;
}

std::string_view trimLine(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.remove_suffix(1);
  }
  return line;
}

std::optional<nlohmann::json> parseObject(std::string_view text) {
  auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

FormatInfo parseFormat(const nlohmann::json& format) {
  FormatInfo info;
  info.format_id = jsonString(format, "format_id");
  info.ext = jsonString(format, "ext");

  info.resolution = jsonOptionalString(format, "resolution");
  if (!info.resolution) {
    auto width = jsonInteger(format, "width");
    auto height = jsonInteger(format, "height");
    if (width && height) {
      info.resolution = std::to_string(*width) + "x" + std::to_string(*height);
    }
  }

  info.abr = jsonNumber(format, "abr");
  info.vcodec = jsonOptionalString(format, "vcodec");
  info.acodec = jsonOptionalString(format, "acodec");

  info.filesize = jsonInteger(format, "filesize");
  if (!info.filesize) {
    info.filesize = jsonInteger(format, "filesize_approx");
  }

  info.format_note = jsonOptionalString(format, "format_note");
  return info;
}

MediaInfo parseMediaInfo(const nlohmann::json& info) {
  MediaInfo media;
  media.id = jsonString(info, "id");
  media.title = jsonString(info, "title");
  media.duration = jsonNumber(info, "duration");
  media.thumbnail = jsonString(info, "thumbnail");
  media.uploader = jsonString(info, "uploader");
  media.webpage_url = jsonString(info, "webpage_url");

  auto formats = info.find("formats");
  if (formats != info.end() && formats->is_array()) {
    for (const auto& format : *formats) {
      if (format.is_object()) {
        media.formats.push_back(parseFormat(format));
      }
    }
  }
  return media;
}

RawProgress parseProgress(const nlohmann::json& progress) {
  RawProgress raw;
  raw.status = jsonString(progress, "status");
  raw.downloaded_bytes = jsonNumber(progress, "downloaded_bytes");
  raw.total_bytes = jsonNumber(progress, "total_bytes");
  raw.total_bytes_estimate = jsonNumber(progress, "total_bytes_estimate");
  raw.percent_str = jsonOptionalString(progress, "_percent_str");
  raw.speed_str = jsonOptionalString(progress, "_speed_str");
  return raw;
}

FetchOutputReader::FetchOutputReader(ExtractionEngine::ProgressHook hook) : hook_(std::move(hook)) {}

void FetchOutputReader::consume(std::string_view raw_line) {
  auto line = trimLine(raw_line);
  if (line.empty()) {
    return;
  }

  if (line.starts_with(kProgressTag)) {
    if (auto progress = parseObject(line.substr(kProgressTag.size()))) {
      if (hook_) {
        hook_(parseProgress(*progress));
      }
    }
    return;
  }

  if (line.starts_with(kPostprocessTag)) {
    if (hook_) {
      RawProgress raw;
      raw.status = "postprocessing";
      hook_(raw);
    }
    return;
  }

  if (line.starts_with(kResultTag)) {
    if (auto document = parseObject(line.substr(kResultTag.size()))) {
      auto filepath = jsonString(*document, "filepath");
      if (!filepath.empty()) {
        result_.output_paths.emplace_back(filepath);
      }
      result_.title = jsonString(*document, "title", result_.title);
      result_.ext = jsonString(*document, "ext", result_.ext);
      has_result_ = true;
    }
    return;
  }

  if (line.starts_with("ERROR:")) {
    last_error_ = std::string(line);
  }
  last_line_ = std::string(line);
}

std::string FetchOutputReader::errorMessage() const {
  if (!last_error_.empty()) {
    return last_error_;
  }
  return last_line_;
}

std::optional<nlohmann::json> findJsonDocument(std::string_view output) {
  size_t start = 0;
  while (start < output.size()) {
    auto end = output.find('\n', start);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    auto line = trimLine(output.substr(start, end - start));
    if (!line.empty() && line.front() == '{') {
      if (auto parsed = parseObject(line)) {
        return parsed;
      }
    }
    start = end + 1;
  }
  return std::nullopt;
}

std::string extractErrorMessage(std::string_view output) {
  auto pos = output.rfind("ERROR:");
  if (pos == std::string_view::npos) {
    return {};
  }
  auto end = output.find('\n', pos);
  return std::string(trimLine(output.substr(pos, end == std::string_view::npos ? end : end - pos)));
}

}
