#pragma once
#include <memory>
#include <vector>
#include "download.hpp"

namespace download_service {

// Receives the events of one download on the worker thread, in emission
// order. onResult is called exactly once and always last.
class DownloadObserver {
public:
  virtual ~DownloadObserver() = default;
  virtual void onProgress(const ProgressEvent& event) = 0;
  virtual void onResult(const DownloadResult& result) = 0;
};

using ObserverList = std::vector<std::shared_ptr<DownloadObserver>>;

}
