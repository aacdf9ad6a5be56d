#include "console_progress_printer.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>

namespace download_service {

ConsoleProgressPrinter::ConsoleProgressPrinter(std::ostream& out, std::ostream& err)
  : out_(out), err_(err) {}

void ConsoleProgressPrinter::onProgress(const ProgressEvent& event) {
  std::lock_guard<std::mutex> lock{mtx_};
  switch (event.phase) {
    case Phase::Downloading: {
      // formatted apart so the caller's stream flags stay untouched
      std::ostringstream line;
      line << "Downloading ";
      if (event.percent) {
        line << std::fixed << std::setprecision(1) << *event.percent << "%";
      } else {
        line << "?%";
      }
      out_ << line.str() << " " << event.message << std::endl;
      break;
    }
    case Phase::Postprocessing:
      // yt-dlp reports every postprocessor step; one line is enough
      if (last_phase_ != Phase::Postprocessing) {
        out_ << event.message << std::endl;
      }
      break;
    case Phase::Failed:
      err_ << event.message << std::endl;
      break;
    case Phase::Preparing:
    case Phase::Finished:
      out_ << event.message << std::endl;
      break;
  }
  last_phase_ = event.phase;
}

void ConsoleProgressPrinter::onResult(const DownloadResult& result) {
  std::lock_guard<std::mutex> lock{mtx_};
  if (result.success && result.output_path) {
    out_ << result.output_path->string() << std::endl;
  }
}

}
