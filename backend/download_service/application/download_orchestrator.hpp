#pragma once

#include <atomic>
#include <expected>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include "common/config/config.hpp"
#include "common/scratch_directory.hpp"
#include "domain/download.hpp"
#include "domain/download_observer.hpp"
#include "domain/extraction_engine.hpp"

namespace download_service {

// One running download. Destroying the handle requests cancellation and
// waits for the worker to finish its cleanup.
class DownloadHandle {
public:
  DownloadHandle(const DownloadHandle&) = delete;
  DownloadHandle& operator=(const DownloadHandle&) = delete;
  ~DownloadHandle() = default;

  // Best effort: the engine stops at its next progress report, otherwise the
  // download runs to completion. Cleanup happens either way.
  void cancel();
  bool isActive() const { return active_.load(std::memory_order_acquire); }
  const DownloadResult& wait() const { return result_.get(); }

private:
  friend class DownloadOrchestrator;
  DownloadHandle() = default;

  std::atomic_bool active_{true};
  std::promise<DownloadResult> promise_;
  std::shared_future<DownloadResult> result_;
  std::jthread worker_;  // last member: joined before the promise goes away
};

class DownloadOrchestrator : public std::enable_shared_from_this<DownloadOrchestrator> {
public:
  using ExecutableLookup = std::function<std::optional<std::filesystem::path>(const std::string&)>;

  DownloadOrchestrator(std::shared_ptr<ExtractionEngine> engine,
                       config::DownloadConfig config,
                       std::string scratch_prefix,
                       ExecutableLookup find_executable);

  // Runs on a dedicated worker thread and returns immediately.
  std::shared_ptr<DownloadHandle> start(DownloadRequest request, ObserverList observers);

  // Runs on the calling thread. Never throws; every outcome, including
  // unexpected exceptions, is reported through the returned result and the
  // observers' onResult.
  DownloadResult run(const DownloadRequest& request,
                     const ObserverList& observers,
                     std::stop_token stop_token = {}) const;

private:
  class ProgressDispatcher;

  DownloadResult execute(const DownloadRequest& request,
                         ProgressDispatcher& dispatcher,
                         std::stop_token stop_token) const;

  std::expected<std::filesystem::path, DownloadError> prepareDestination(
    const std::filesystem::path& requested) const;

  std::optional<std::filesystem::path> resolveOutput(
    const FetchResult& fetched,
    const common::ScratchDirectory& scratch) const;

  std::expected<std::filesystem::path, DownloadError> placeOutput(
    const std::filesystem::path& produced,
    const std::filesystem::path& destination) const;

  std::shared_ptr<ExtractionEngine> engine_;
  config::DownloadConfig config_;
  std::string scratch_prefix_;
  ExecutableLookup find_executable_;
};

}
