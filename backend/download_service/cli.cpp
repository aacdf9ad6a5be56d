#include "application/download_orchestrator.hpp"
#include "infrastructure/executable_locator.hpp"
#include "infrastructure/ytdlp_engine.hpp"
#include "interface/console_progress_printer.hpp"
#include "common/config/config.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

std::atomic_bool interrupted{false};

void onInterrupt(int) {
  interrupted.store(true);
}

void printUsage(const char* programName) {
  std::cerr << "Usage: " << programName
            << " --url <url> [--out <directory>] [--aria2c] [--format <format_id>]"
            << std::endl;
  std::cerr << "Options:\n"
            << "  --url <url>          Page or media URL to download (required)\n"
            << "  --out <directory>    Destination directory (default: ~/Downloads)\n"
            << "  --aria2c             Use aria2c as external downloader\n"
            << "  --format <id>        yt-dlp format selector\n"
            << "  -h, --help           Show this message" << std::endl;
}

std::filesystem::path defaultDestination() {
  const char* home = std::getenv("HOME");
  if (home == nullptr) {
    return std::filesystem::current_path();
  }
  return std::filesystem::path(home) / "Downloads";
}

} // namespace

int main(int argc, char** argv) {
  download_service::DownloadRequest request;
  request.destination_directory = defaultDestination();

  int arg_index = 1;
  while (arg_index < argc) {
    const std::string option = argv[arg_index];

    if (option == "-h" || option == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (option == "--aria2c") {
      request.use_external_accelerator = true;
      arg_index += 1;
    } else if (option == "--url" || option == "--out" || option == "--format") {
      if (arg_index + 1 >= argc) {
        std::cerr << option << " needs a value" << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
      }
      const std::string value = argv[arg_index + 1];
      if (option == "--url") {
        request.source_url = value;
      } else if (option == "--out") {
        request.destination_directory = value;
      } else {
        request.format_selector = value;
      }
      arg_index += 2;
    } else {
      std::cerr << "Unknown option: " << option << std::endl;
      printUsage(argv[0]);
      return kExitUsage;
    }
  }

  if (request.source_url.empty()) {
    std::cerr << "--url is required" << std::endl;
    printUsage(argv[0]);
    return kExitUsage;
  }

  try {
    const auto cfg = config::Config::fromEnvironment();

    std::shared_ptr<download_service::ExtractionEngine> engine =
      std::make_shared<download_service::YtDlpEngine>(cfg.getEngine());
    auto orchestrator = std::make_shared<download_service::DownloadOrchestrator>(
      engine, cfg.getDownload(), cfg.getStorage().scratch_prefix, &download_service::findExecutable);

    auto printer = std::make_shared<download_service::ConsoleProgressPrinter>(std::cout, std::cerr);

    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);

    auto handle = orchestrator->start(std::move(request), {printer});
    bool cancel_sent = false;
    while (handle->isActive()) {
      if (interrupted.load() && !cancel_sent) {
        std::cerr << "Cancelling..." << std::endl;
        handle->cancel();
        cancel_sent = true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    const auto& result = handle->wait();
    return result.success ? 0 : kExitFailure;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitFailure;
  }
}
