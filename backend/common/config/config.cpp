#include "config.hpp"
#include <charconv>
#include <cstdlib>
#include <system_error>

namespace config {

namespace {

std::optional<std::string> readEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

template <typename T>
T readEnvNumber(const char* name, T fallback) {
  auto value = readEnv(name);
  if (!value) {
    return fallback;
  }
  T parsed{};
  auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
  if (ec != std::errc{} || ptr != value->data() + value->size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string> splitList(const std::string& raw) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= raw.size()) {
    auto end = raw.find(',', start);
    if (end == std::string::npos) {
      end = raw.size();
    }
    auto item = raw.substr(start, end - start);
    auto first = item.find_first_not_of(" \t");
    auto last = item.find_last_not_of(" \t");
    if (first != std::string::npos) {
      items.push_back(item.substr(first, last - first + 1));
    }
    start = end + 1;
  }
  return items;
}

std::filesystem::path systemTempDirectory() {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return "/tmp";
  }
  return dir;
}

} // namespace

Config::Config() {
  server_ = {
    .host = "127.0.0.1",
    .port = 8000,
    .worker_threads = 4
  };

  engine_ = {
    .binary = "yt-dlp",
    .cookies_file = std::nullopt,
    .youtube_clients = {"android", "ios"},
    .retries = 3,
    .user_agent = "Mozilla/5.0 (Linux; Android 13; Pixel 6 Pro) AppleWebKit/537.36 "
                  "(KHTML, like Gecko) Chrome/126.0.0.0 Mobile Safari/537.36",
    .accept_language = "en-US,en;q=0.9"
  };

  storage_ = {
    .scratch_root = systemTempDirectory(),
    .scratch_prefix = "ytdlp_",
    .chunk_size = 1024 * 1024
  };

  download_ = {
    .accelerator = "aria2c",
    .accelerator_args = {
      "--max-connection-per-server=16",
      "--split=16",
      "--min-split-size=1M",
      "--file-allocation=none",
      "--continue=true"
    },
    .concurrent_fragments = 4,
    .merge_output_format = "mp4",
    .output_template = "%(title).70s.%(ext)s"
  };
}

Config Config::defaults() {
  return Config{};
}

Config Config::fromEnvironment() {
  Config cfg;

  if (auto host = readEnv("GLASSDL_HOST")) {
    cfg.server_.host = *host;
  }
  cfg.server_.port = readEnvNumber<unsigned short>("GLASSDL_PORT", cfg.server_.port);
  cfg.server_.worker_threads = readEnvNumber<unsigned int>("GLASSDL_WORKERS", cfg.server_.worker_threads);
  if (cfg.server_.worker_threads == 0) {
    cfg.server_.worker_threads = 1;
  }

  if (auto binary = readEnv("YTDLP_BINARY")) {
    cfg.engine_.binary = *binary;
  }
  if (auto cookies = readEnv("YTDLP_COOKIES")) {
    cfg.engine_.cookies_file = std::filesystem::path(*cookies);
  }
  if (auto clients = readEnv("YTDLP_YOUTUBE_CLIENTS")) {
    cfg.engine_.youtube_clients = splitList(*clients);
  }

  if (auto scratch = readEnv("GLASSDL_SCRATCH_ROOT")) {
    cfg.storage_.scratch_root = *scratch;
  }

  return cfg;
}

} // namespace config
