#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include "application/download_orchestrator.hpp"
#include "test_support.hpp"

using namespace download_service;
using glassdl_test::FakeEngine;
using glassdl_test::RecordingObserver;
namespace fs = std::filesystem;

namespace {

class DownloadOrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    engine = std::make_shared<FakeEngine>();
    orchestrator = makeOrchestrator([this](const std::string& name) -> std::optional<fs::path> {
      ++lookups;
      looked_up = name;
      return accelerator_path;
    });
    observer = std::make_shared<RecordingObserver>();
  }

  std::shared_ptr<DownloadOrchestrator> makeOrchestrator(DownloadOrchestrator::ExecutableLookup lookup) {
    return std::make_shared<DownloadOrchestrator>(
      engine, config::Config::defaults().getDownload(), "ytdlp_", std::move(lookup));
  }

  DownloadRequest request(const std::string& url = "https://example.com/watch?v=1") {
    DownloadRequest req;
    req.source_url = url;
    req.destination_directory = dest.path();
    return req;
  }

  DownloadResult runOnce(const DownloadRequest& req) {
    return orchestrator->run(req, {observer});
  }

  common::ScratchDirectory dest = glassdl_test::makeTempDir();
  std::shared_ptr<FakeEngine> engine;
  std::shared_ptr<DownloadOrchestrator> orchestrator;
  std::shared_ptr<RecordingObserver> observer;

  int lookups{0};
  std::string looked_up;
  std::optional<fs::path> accelerator_path;
};

} // namespace

TEST_F(DownloadOrchestratorTest, MovesFileIntoDestinationAndRemovesScratch) {
  auto result = runOnce(request());

  ASSERT_TRUE(result.success) << result.error->message;
  EXPECT_EQ(*result.output_path, dest.path() / "clip.mp4");
  EXPECT_EQ(glassdl_test::readFile(*result.output_path), "video-bytes");
  EXPECT_FALSE(result.scratch);
  EXPECT_EQ(glassdl_test::countEntries(dest.path()), 1u);
}

TEST_F(DownloadOrchestratorTest, ScratchLivesInsideDestinationWithTemplate) {
  runOnce(request());

  ASSERT_EQ(engine->templates.size(), 1u);
  auto tmpl = engine->templates.front();
  EXPECT_EQ(tmpl.filename(), "%(title).70s.%(ext)s");
  auto scratch = tmpl.parent_path();
  EXPECT_EQ(scratch.parent_path(), dest.path());
  EXPECT_TRUE(scratch.filename().string().starts_with("ytdlp_"));
  EXPECT_FALSE(fs::exists(scratch));
}

TEST_F(DownloadOrchestratorTest, EmitsResetFirstAndExactlyOneResultLast) {
  auto result = runOnce(request());
  ASSERT_TRUE(result.success);

  ASSERT_GE(observer->events.size(), 3u);
  const auto& first = observer->events.front();
  EXPECT_EQ(first.phase, Phase::Preparing);
  EXPECT_DOUBLE_EQ(*first.percent, 0.0);

  const auto& last = observer->events.back();
  EXPECT_EQ(last.phase, Phase::Finished);
  EXPECT_DOUBLE_EQ(*last.percent, 100.0);
  EXPECT_NE(last.message.find("clip.mp4"), std::string::npos);

  ASSERT_EQ(observer->results.size(), 1u);
  EXPECT_EQ(observer->events_before_result, observer->events.size());
}

TEST_F(DownloadOrchestratorTest, PercentNeverGoesBackwards) {
  engine->on_fetch = [](const fs::path& tmpl, const FetchOptions&,
                        const ExtractionEngine::ProgressHook& hook, std::stop_token) {
    for (const char* pct : {"50%", "30%", "70%", "10%"}) {
      RawProgress raw;
      raw.status = "downloading";
      raw.percent_str = pct;
      hook(raw);
    }
    // a second stream restarting from zero, as with separate video and audio
    RawProgress raw;
    raw.status = "downloading";
    raw.downloaded_bytes = 0;
    raw.total_bytes = 100;
    hook(raw);
    return FakeEngine::writeDefault(tmpl, hook);
  };

  auto result = runOnce(request());
  ASSERT_TRUE(result.success);

  double previous = 0.0;
  for (const auto& event : observer->events) {
    if (event.percent) {
      EXPECT_GE(*event.percent, previous) << event.message;
      previous = *event.percent;
    }
  }
  EXPECT_DOUBLE_EQ(previous, 100.0);
}

TEST_F(DownloadOrchestratorTest, KeepsExistingFilesBySuffixing) {
  glassdl_test::writeFile(dest.path() / "clip.mp4", "old");
  glassdl_test::writeFile(dest.path() / "clip (1).mp4", "older");

  auto result = runOnce(request());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(*result.output_path, dest.path() / "clip (2).mp4");
  EXPECT_EQ(glassdl_test::readFile(dest.path() / "clip.mp4"), "old");
}

TEST_F(DownloadOrchestratorTest, BlankUrlIsRejectedWithoutCallingEngine) {
  auto result = runOnce(request("   "));

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::Validation);
  EXPECT_EQ(engine->fetch_calls.load(), 0);
  ASSERT_EQ(observer->results.size(), 1u);
  ASSERT_FALSE(observer->events.empty());
  EXPECT_EQ(observer->events.back().phase, Phase::Failed);
}

TEST_F(DownloadOrchestratorTest, MissingAcceleratorFailsBeforeEngine) {
  auto req = request();
  req.use_external_accelerator = true;

  auto result = runOnce(req);

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::AcceleratorUnavailable);
  EXPECT_NE(result.error->message.find("aria2c"), std::string::npos);
  EXPECT_EQ(lookups, 1);
  EXPECT_EQ(looked_up, "aria2c");
  EXPECT_EQ(engine->fetch_calls.load(), 0);
  EXPECT_EQ(glassdl_test::countEntries(dest.path()), 0u);
}

TEST_F(DownloadOrchestratorTest, AcceleratorIsPassedToEngineWhenFound) {
  accelerator_path = fs::path("/opt/bin/aria2c");
  auto req = request();
  req.use_external_accelerator = true;

  auto result = runOnce(req);

  ASSERT_TRUE(result.success);
  ASSERT_TRUE(engine->last_options.accelerator);
  EXPECT_EQ(engine->last_options.accelerator->program, "/opt/bin/aria2c");
  EXPECT_EQ(engine->last_options.accelerator->args,
            config::Config::defaults().getDownload().accelerator_args);
}

TEST_F(DownloadOrchestratorTest, AcceleratorNotLookedUpUnlessRequested) {
  runOnce(request());
  EXPECT_EQ(lookups, 0);
  EXPECT_FALSE(engine->last_options.accelerator);
}

TEST_F(DownloadOrchestratorTest, FormatSelectorIsTrimmedAndBlankMeansDefault) {
  auto req = request();
  req.format_selector = " 137+140 ";
  runOnce(req);
  EXPECT_EQ(engine->last_options.format_id, "137+140");

  req.format_selector = "  ";
  runOnce(req);
  EXPECT_FALSE(engine->last_options.format_id);
}

TEST_F(DownloadOrchestratorTest, EngineFailureCleansUp) {
  engine->on_fetch = [](const fs::path& tmpl, const FetchOptions&,
                        const ExtractionEngine::ProgressHook&, std::stop_token)
      -> std::expected<FetchResult, std::string> {
    glassdl_test::writeFile(tmpl.parent_path() / "partial.part", "x");
    return std::unexpected(std::string("ERROR: Video unavailable"));
  };

  auto result = runOnce(request());

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::Engine);
  EXPECT_EQ(result.error->message, "ERROR: Video unavailable");
  EXPECT_EQ(glassdl_test::countEntries(dest.path()), 0u);
  EXPECT_EQ(observer->results.size(), 1u);
  EXPECT_EQ(observer->events.back().phase, Phase::Failed);
}

TEST_F(DownloadOrchestratorTest, EngineExceptionBecomesFailure) {
  engine->on_fetch = [](const fs::path&, const FetchOptions&,
                        const ExtractionEngine::ProgressHook&, std::stop_token)
      -> std::expected<FetchResult, std::string> {
    throw std::runtime_error("boom");
  };

  auto result = runOnce(request());

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::Engine);
  EXPECT_EQ(result.error->message, "boom");
  EXPECT_EQ(glassdl_test::countEntries(dest.path()), 0u);
  EXPECT_EQ(observer->results.size(), 1u);
}

TEST_F(DownloadOrchestratorTest, IgnoresReportedPathsOutsideScratch) {
  auto outside = dest.path() / "elsewhere.mp4";
  glassdl_test::writeFile(outside, "not ours");
  engine->on_fetch = [outside](const fs::path& tmpl, const FetchOptions&,
                               const ExtractionEngine::ProgressHook&, std::stop_token) {
    glassdl_test::writeFile(tmpl.parent_path() / "Title.webm", "ours");
    return std::expected<FetchResult, std::string>(FetchResult{{outside}, "Title", "webm"});
  };

  auto result = runOnce(request());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output_path->filename(), "Title.webm");
  EXPECT_EQ(glassdl_test::readFile(*result.output_path), "ours");
  EXPECT_EQ(glassdl_test::readFile(outside), "not ours");
}

TEST_F(DownloadOrchestratorTest, FallsBackToAnyFileInScratch) {
  engine->on_fetch = [](const fs::path& tmpl, const FetchOptions&,
                        const ExtractionEngine::ProgressHook&, std::stop_token) {
    glassdl_test::writeFile(tmpl.parent_path() / "renamed by postprocessor.m4a", "audio");
    return std::expected<FetchResult, std::string>(
      FetchResult{{tmpl.parent_path() / "gone.mp4"}, "Something", "mp4"});
  };

  auto result = runOnce(request());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output_path->filename(), "renamed by postprocessor.m4a");
}

TEST_F(DownloadOrchestratorTest, NothingProducedIsOutputNotFound) {
  engine->on_fetch = [](const fs::path&, const FetchOptions&,
                        const ExtractionEngine::ProgressHook&, std::stop_token) {
    return std::expected<FetchResult, std::string>(FetchResult{});
  };

  auto result = runOnce(request());

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::OutputNotFound);
  EXPECT_EQ(glassdl_test::countEntries(dest.path()), 0u);
}

TEST_F(DownloadOrchestratorTest, UnusableDestinationIsDirectoryError) {
  auto blocker = dest.path() / "a-file";
  glassdl_test::writeFile(blocker, "x");
  auto req = request();
  req.destination_directory = blocker / "sub";

  auto result = runOnce(req);

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::Directory);
  EXPECT_EQ(engine->fetch_calls.load(), 0);
}

TEST_F(DownloadOrchestratorTest, CreatesMissingDestination) {
  auto req = request();
  req.destination_directory = dest.path() / "new" / "nested";

  auto result = runOnce(req);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output_path->parent_path(), dest.path() / "new" / "nested");
}

TEST_F(DownloadOrchestratorTest, HandOffKeepsScratchUntilResultIsReleased) {
  auto req = request();
  req.hand_off_output = true;

  auto result = orchestrator->run(req, {});

  ASSERT_TRUE(result.success);
  ASSERT_TRUE(result.scratch);
  EXPECT_TRUE(result.scratch->contains(*result.output_path));
  EXPECT_TRUE(fs::exists(*result.output_path));
  auto scratch_path = result.scratch->path();

  result.scratch.reset();
  EXPECT_FALSE(fs::exists(scratch_path));
}

TEST_F(DownloadOrchestratorTest, ThrowingObserverDoesNotBreakOthers) {
  class Thrower : public DownloadObserver {
  public:
    void onProgress(const ProgressEvent&) override { throw std::runtime_error("ui gone"); }
    void onResult(const DownloadResult&) override { throw std::runtime_error("ui gone"); }
  };

  auto result = orchestrator->run(request(), {std::make_shared<Thrower>(), observer});

  EXPECT_TRUE(result.success);
  EXPECT_EQ(observer->results.size(), 1u);
}

TEST_F(DownloadOrchestratorTest, StartRunsInBackgroundAndReportsThroughHandle) {
  auto handle = orchestrator->start(request(), {observer});
  const auto& result = handle->wait();

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(fs::exists(*result.output_path));
  EXPECT_EQ(observer->results.size(), 1u);
}

TEST_F(DownloadOrchestratorTest, CancelStopsEngineAndCleansUp) {
  std::atomic_bool started{false};
  engine->on_fetch = [&started](const fs::path& tmpl, const FetchOptions&,
                                const ExtractionEngine::ProgressHook& hook, std::stop_token stop_token)
      -> std::expected<FetchResult, std::string> {
    glassdl_test::writeFile(tmpl.parent_path() / "clip.mp4.part", "partial");
    started = true;
    while (!stop_token.stop_requested()) {
      RawProgress raw;
      raw.status = "downloading";
      hook(raw);
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return std::unexpected(std::string("Download cancelled"));
  };

  auto handle = orchestrator->start(request(), {observer});
  while (!started) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_TRUE(handle->isActive());
  handle->cancel();
  const auto& result = handle->wait();

  ASSERT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::Cancelled);
  EXPECT_EQ(glassdl_test::countEntries(dest.path()), 0u);
  EXPECT_EQ(observer->results.size(), 1u);
}

TEST_F(DownloadOrchestratorTest, ConcurrentDownloadsUseSeparateScratchDirectories) {
  std::atomic_int inside{0};
  engine->on_fetch = [&inside](const fs::path& tmpl, const FetchOptions&,
                               const ExtractionEngine::ProgressHook& hook, std::stop_token) {
    ++inside;
    while (inside < 2) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return FakeEngine::writeDefault(tmpl, hook, "same-title", tmpl.parent_path().filename().string());
  };

  auto first = orchestrator->start(request(), {});
  auto second = orchestrator->start(request(), {});
  const auto& a = first->wait();
  const auto& b = second->wait();

  ASSERT_TRUE(a.success);
  ASSERT_TRUE(b.success);
  EXPECT_NE(*a.output_path, *b.output_path);
  EXPECT_NE(glassdl_test::readFile(*a.output_path), glassdl_test::readFile(*b.output_path));
  EXPECT_NE(engine->templates[0].parent_path(), engine->templates[1].parent_path());
  EXPECT_EQ(glassdl_test::countEntries(dest.path()), 2u);
}
