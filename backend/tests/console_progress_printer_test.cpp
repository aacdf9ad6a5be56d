#include <sstream>
#include <gtest/gtest.h>
#include "interface/console_progress_printer.hpp"

using namespace download_service;

TEST(ConsoleProgressPrinterTest, PrintsDownloadLinesAndFinalPath) {
  std::ostringstream out;
  std::ostringstream err;
  ConsoleProgressPrinter printer(out, err);

  printer.onProgress({Phase::Preparing, 0.0, "Preparing download…"});
  printer.onProgress({Phase::Downloading, 42.26, "Downloading… 1.0MiB/s"});
  printer.onProgress({Phase::Downloading, std::nullopt, "Downloading…"});
  printer.onProgress({Phase::Postprocessing, 100.0, "Post-processing…"});
  printer.onProgress({Phase::Postprocessing, 100.0, "Post-processing…"});
  printer.onResult(DownloadResult::succeeded("/tmp/out/clip.mp4"));

  EXPECT_EQ(out.str(),
            "Preparing download…\n"
            "Downloading 42.3% Downloading… 1.0MiB/s\n"
            "Downloading ?% Downloading…\n"
            "Post-processing…\n"
            "/tmp/out/clip.mp4\n");
  EXPECT_TRUE(err.str().empty());
}

TEST(ConsoleProgressPrinterTest, FailuresGoToErrorStream) {
  std::ostringstream out;
  std::ostringstream err;
  ConsoleProgressPrinter printer(out, err);

  printer.onProgress({Phase::Failed, std::nullopt, "Error: ERROR: Video unavailable"});
  printer.onResult(DownloadResult::failed({ErrorKind::Engine, "ERROR: Video unavailable"}));

  EXPECT_TRUE(out.str().empty());
  EXPECT_EQ(err.str(), "Error: ERROR: Video unavailable\n");
}

TEST(ConsoleProgressPrinterTest, LeavesStreamFormattingAlone) {
  std::ostringstream out;
  std::ostringstream err;
  ConsoleProgressPrinter printer(out, err);

  printer.onProgress({Phase::Downloading, 12.0, "Downloading…"});
  out.str("");
  out << 1.0 / 3.0;

  EXPECT_EQ(out.str(), "0.333333");
}
