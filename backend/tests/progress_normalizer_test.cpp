#include <gtest/gtest.h>
#include <limits>
#include "application/progress_normalizer.hpp"

using download_service::Phase;
using download_service::ProgressNormalizer;
using download_service::RawProgress;

namespace {

RawProgress downloading() {
  RawProgress raw;
  raw.status = "downloading";
  return raw;
}

} // namespace

TEST(ProgressNormalizerTest, ParsesPercentStrings) {
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::parsePercent("42.5%"), 42.5);
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::parsePercent("  7.0 % "), 7.0);
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::parsePercent("\x1b[0;94m 63.1%\x1b[0m"), 63.1);
  EXPECT_FALSE(ProgressNormalizer::parsePercent("N/A"));
  EXPECT_FALSE(ProgressNormalizer::parsePercent("12.5abc%"));
  EXPECT_FALSE(ProgressNormalizer::parsePercent(""));
  EXPECT_FALSE(ProgressNormalizer::parsePercent("inf%"));
}

TEST(ProgressNormalizerTest, PercentStringWinsOverByteCounts) {
  auto raw = downloading();
  raw.percent_str = "10%";
  raw.downloaded_bytes = 90;
  raw.total_bytes = 100;
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::normalize(raw).percent, 10.0);
}

TEST(ProgressNormalizerTest, FallsBackToByteRatio) {
  auto raw = downloading();
  raw.percent_str = "garbage";
  raw.downloaded_bytes = 25;
  raw.total_bytes = 200;
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::normalize(raw).percent, 12.5);
}

TEST(ProgressNormalizerTest, UsesEstimateWhenTotalMissingOrZero) {
  auto raw = downloading();
  raw.downloaded_bytes = 50;
  raw.total_bytes = 0;
  raw.total_bytes_estimate = 200;
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::normalize(raw).percent, 25.0);

  raw.total_bytes.reset();
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::normalize(raw).percent, 25.0);
}

TEST(ProgressNormalizerTest, MissingDownloadedCountsAsZero) {
  auto raw = downloading();
  raw.total_bytes = 100;
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::normalize(raw).percent, 0.0);
}

TEST(ProgressNormalizerTest, AbsentWhenNothingUsable) {
  auto raw = downloading();
  raw.downloaded_bytes = 10;
  raw.total_bytes = 0;
  auto event = ProgressNormalizer::normalize(raw);
  EXPECT_EQ(event.phase, Phase::Downloading);
  EXPECT_FALSE(event.percent);
}

TEST(ProgressNormalizerTest, ClampsToValidRange) {
  auto raw = downloading();
  raw.downloaded_bytes = 150;
  raw.total_bytes = 100;
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::normalize(raw).percent, 100.0);

  raw = downloading();
  raw.percent_str = "-3%";
  EXPECT_DOUBLE_EQ(*ProgressNormalizer::normalize(raw).percent, 0.0);
}

TEST(ProgressNormalizerTest, AppendsSpeedToMessage) {
  auto raw = downloading();
  raw.speed_str = " 1.20MiB/s";
  EXPECT_EQ(ProgressNormalizer::normalize(raw).message, "Downloading… 1.20MiB/s");

  raw.speed_str.reset();
  EXPECT_EQ(ProgressNormalizer::normalize(raw).message, "Downloading…");
}

TEST(ProgressNormalizerTest, MapsTerminalAndUnknownStatuses) {
  RawProgress raw;
  raw.status = "finished";
  auto finished = ProgressNormalizer::normalize(raw);
  EXPECT_EQ(finished.phase, Phase::Finished);
  EXPECT_DOUBLE_EQ(*finished.percent, 100.0);
  EXPECT_EQ(finished.message, "postprocessing starting");

  raw.status = "postprocessing";
  auto post = ProgressNormalizer::normalize(raw);
  EXPECT_EQ(post.phase, Phase::Postprocessing);
  EXPECT_DOUBLE_EQ(*post.percent, 100.0);

  raw.status = "error";
  raw.downloaded_bytes = 1;
  raw.total_bytes = 2;
  auto other = ProgressNormalizer::normalize(raw);
  EXPECT_EQ(other.phase, Phase::Preparing);
  EXPECT_FALSE(other.percent);
  EXPECT_EQ(other.message, "Preparing…");
}

TEST(ProgressNormalizerTest, IgnoresNonFiniteTotals) {
  auto raw = downloading();
  raw.downloaded_bytes = 1;
  raw.total_bytes = std::numeric_limits<double>::infinity();
  EXPECT_FALSE(ProgressNormalizer::normalize(raw).percent);
}
