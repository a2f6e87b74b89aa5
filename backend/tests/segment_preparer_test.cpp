#include <gtest/gtest.h>
#include "common/config/config.hpp"
#include "infrastructure/segment_preparer.hpp"
#include "test_helpers.hpp"

namespace {

using namespace workout_service;
using workout_test::FakeRunner;
using workout_test::readFile;
using workout_test::TempDir;

class SegmentPreparerTest : public ::testing::Test {
protected:
  void SetUp() override {
    workout_test::writeFile(dir_ / "squat.mov", "squat-frames");
    asset_ = ResolvedAsset{"squat.mov", (dir_ / "squat.mov").string(), 12};
  }

  TempDir dir_;
  ResolvedAsset asset_;
  std::shared_ptr<FakeRunner> runner_ = std::make_shared<FakeRunner>();
  SegmentPreparer preparer_{runner_,
                            std::make_shared<const FfmpegCommands>(config::Config::getInstance().getEncoder()),
                            std::chrono::seconds(30)};
};

TEST_F(SegmentPreparerTest, TrimsIntoWorkDir) {
  auto segment = preparer_.prepare(asset_, "Squat", 40, dir_.path(), 3);
  EXPECT_FALSE(segment.degraded);
  EXPECT_EQ(segment.kind, SegmentKind::Exercise);
  EXPECT_EQ(segment.path, (dir_ / "trimmed_3.mp4").string());
  EXPECT_EQ(readFile(segment.path), "squat-frames");
  EXPECT_EQ(segment.duration, 40);
  EXPECT_EQ(runner_->count("trim"), 1u);
}

TEST_F(SegmentPreparerTest, FailedTrimFallsBackToSource) {
  runner_->fail_when = [](const CommandSpec& c) { return FakeRunner::kindOf(c) == "trim"; };
  auto segment = preparer_.prepare(asset_, "Squat", 40, dir_.path(), 0);
  EXPECT_TRUE(segment.degraded);
  EXPECT_EQ(segment.path, asset_.local_path);
  EXPECT_FALSE(std::filesystem::exists(dir_ / "trimmed_0.mp4"));
}

TEST_F(SegmentPreparerTest, TrimReportsEncoderOutput) {
  runner_->fail_when = [](const CommandSpec&) { return true; };
  auto res = preparer_.trim(asset_.local_path, 40, (dir_ / "out.mp4").string());
  ASSERT_FALSE(res);
  EXPECT_EQ(res.error().kind, ErrorKind::EncodeFailed);
  EXPECT_EQ(res.error().diagnostics, "boom");

  auto invalid = preparer_.trim(asset_.local_path, 0, (dir_ / "out.mp4").string());
  ASSERT_FALSE(invalid);
  EXPECT_EQ(invalid.error().kind, ErrorKind::InvalidRequest);
}

} // namespace
