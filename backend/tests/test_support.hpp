#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "common/scratch_directory.hpp"
#include "domain/download_observer.hpp"
#include "domain/extraction_engine.hpp"

namespace glassdl_test {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed at the end of the test.
inline common::ScratchDirectory makeTempDir() {
  auto dir = common::ScratchDirectory::create(fs::temp_directory_path(), "glassdl_test_");
  if (!dir) {
    throw std::runtime_error(dir.error());
  }
  return std::move(*dir);
}

inline void writeFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

inline std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline size_t countEntries(const fs::path& dir) {
  size_t count = 0;
  for ([[maybe_unused]] const auto& entry : fs::directory_iterator(dir)) {
    ++count;
  }
  return count;
}

// Scripted engine. By default fetch reports some progress and writes
// "<title>.mp4" next to the output template.
class FakeEngine : public download_service::ExtractionEngine {
public:
  using FetchFn = std::function<std::expected<download_service::FetchResult, std::string>(
    const fs::path& output_template,
    const download_service::FetchOptions& options,
    const ProgressHook& hook,
    std::stop_token stop_token)>;

  std::expected<download_service::MediaInfo, std::string> extractInfo(const std::string& url) override {
    ++info_calls;
    last_url = url;
    return info_result;
  }

  std::expected<download_service::FetchResult, std::string> fetch(
    const std::string& url,
    const fs::path& output_template,
    const download_service::FetchOptions& options,
    ProgressHook progress_hook,
    std::stop_token stop_token
  ) override {
    ++fetch_calls;
    {
      std::lock_guard<std::mutex> lock{mtx};
      last_url = url;
      last_options = options;
      templates.push_back(output_template);
    }
    if (on_fetch) {
      return on_fetch(output_template, options, progress_hook, stop_token);
    }
    return writeDefault(output_template, progress_hook);
  }

  static std::expected<download_service::FetchResult, std::string> writeDefault(
    const fs::path& output_template, const ProgressHook& hook,
    const std::string& title = "clip", const std::string& content = "video-bytes") {
    download_service::RawProgress raw;
    raw.status = "downloading";
    raw.downloaded_bytes = 5;
    raw.total_bytes = 10;
    hook(raw);
    raw.status = "finished";
    hook(raw);

    auto file = output_template.parent_path() / (title + ".mp4");
    writeFile(file, content);
    return download_service::FetchResult{{file}, title, "mp4"};
  }

  std::expected<download_service::MediaInfo, std::string> info_result =
    std::unexpected(std::string("info not scripted"));
  FetchFn on_fetch;

  std::atomic_int info_calls{0};
  std::atomic_int fetch_calls{0};
  std::mutex mtx;
  std::string last_url;
  download_service::FetchOptions last_options;
  std::vector<fs::path> templates;
};

// Records every callback; thread-safe so it can be read after wait().
class RecordingObserver : public download_service::DownloadObserver {
public:
  void onProgress(const download_service::ProgressEvent& event) override {
    std::lock_guard<std::mutex> lock{mtx};
    events.push_back(event);
  }

  void onResult(const download_service::DownloadResult& result) override {
    std::lock_guard<std::mutex> lock{mtx};
    results.push_back(result);
    events_before_result = events.size();
  }

  std::mutex mtx;
  std::vector<download_service::ProgressEvent> events;
  std::vector<download_service::DownloadResult> results;
  size_t events_before_result{0};
};

} // namespace glassdl_test
