#include "progress_normalizer.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <string>

namespace download_service {

namespace {

// yt-dlp colours its preformatted strings when it thinks it is on a tty
std::string stripAnsi(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
      i += 2;
      while (i < text.size() && !(text[i] >= '@' && text[i] <= '~')) {
        ++i;
      }
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string_view trim(std::string_view text) {
  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

double clampPercent(double value) {
  return std::clamp(value, 0.0, 100.0);
}

} // namespace

std::optional<double> ProgressNormalizer::parsePercent(std::string_view text) {
  auto cleaned = stripAnsi(text);
  auto view = trim(cleaned);
  if (!view.empty() && view.back() == '%') {
    view.remove_suffix(1);
    view = trim(view);
  }
  if (view.empty()) {
    return std::nullopt;
  }

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
  if (ec != std::errc{} || ptr != view.data() + view.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> ProgressNormalizer::resolvePercent(const RawProgress& raw) {
  if (raw.percent_str) {
    if (auto parsed = parsePercent(*raw.percent_str)) {
      return clampPercent(*parsed);
    }
  }

  auto total = raw.total_bytes;
  if (!total || *total == 0.0) {
    total = raw.total_bytes_estimate;
  }
  if (total && *total != 0.0 && std::isfinite(*total)) {
    double downloaded = raw.downloaded_bytes.value_or(0.0);
    double percent = downloaded / *total * 100.0;
    if (std::isfinite(percent)) {
      return clampPercent(percent);
    }
  }
  return std::nullopt;
}

ProgressEvent ProgressNormalizer::normalize(const RawProgress& raw) {
  if (raw.status == "downloading") {
    ProgressEvent event{Phase::Downloading, resolvePercent(raw), "Downloading…"};
    if (raw.speed_str) {
      auto speed = stripAnsi(*raw.speed_str);
      auto trimmed = trim(speed);
      if (!trimmed.empty()) {
        event.message += " " + std::string(trimmed);
      }
    }
    return event;
  }
  if (raw.status == "finished") {
    return ProgressEvent{Phase::Finished, 100.0, "postprocessing starting"};
  }
  if (raw.status == "postprocessing") {
    return ProgressEvent{Phase::Postprocessing, 100.0, "Post-processing…"};
  }
  return ProgressEvent{Phase::Preparing, std::nullopt, "Preparing…"};
}

}
