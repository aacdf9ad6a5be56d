#pragma once
#include <iosfwd>
#include <mutex>
#include "domain/download_observer.hpp"

namespace download_service {

// Line-per-event observer for the console front-end.
class ConsoleProgressPrinter : public DownloadObserver {
public:
  ConsoleProgressPrinter(std::ostream& out, std::ostream& err);

  void onProgress(const ProgressEvent& event) override;
  void onResult(const DownloadResult& result) override;

private:
  std::mutex mtx_;
  std::ostream& out_;
  std::ostream& err_;
  Phase last_phase_{Phase::Preparing};
};

}
