#include <gtest/gtest.h>
#include "common/config/config.hpp"
#include "infrastructure/sequential_assembler.hpp"
#include "test_helpers.hpp"

namespace {

using namespace workout_service;
using workout_test::FakeProber;
using workout_test::FakeRunner;
using workout_test::readFile;
using workout_test::TempDir;
using workout_test::writeFile;

class SequentialAssemblerTest : public ::testing::Test {
protected:
  void SetUp() override {
    prober_->fallback = workout_test::targetFormat();
    for (const auto& name : {"a", "b", "c"}) {
      writeFile(dir_ / (std::string(name) + ".mp4"), name);
      segments_.push_back((dir_ / (std::string(name) + ".mp4")).string());
    }
  }

  TempDir dir_;
  std::vector<std::string> segments_;
  std::shared_ptr<FakeRunner> runner_ = std::make_shared<FakeRunner>();
  std::shared_ptr<FakeProber> prober_ = std::make_shared<FakeProber>();
  SequentialAssembler assembler_{runner_,
                                 std::make_shared<const FfmpegCommands>(config::Config::getInstance().getEncoder()),
                                 prober_, std::chrono::seconds(30)};
};

TEST_F(SequentialAssemblerTest, SinglePassStreamCopy) {
  auto out = dir_ / "out.mp4";
  auto report = assembler_.build(segments_, out, dir_.path());
  ASSERT_TRUE(report) << report.error().describe();
  EXPECT_EQ(report->strategy, "sequential");
  EXPECT_EQ(report->stream_copy_merges, 1u);
  EXPECT_EQ(runner_->count("concat_copy"), 1u);
  EXPECT_EQ(readFile(out), "abc");
  EXPECT_FALSE(std::filesystem::exists(dir_ / "concat_all.txt"));
}

TEST_F(SequentialAssemblerTest, OffTargetInputIsReencoded) {
  prober_->formats[segments_[2]] = workout_test::otherFormat();
  auto out = dir_ / "out.mp4";
  auto report = assembler_.build(segments_, out, dir_.path());
  ASSERT_TRUE(report);
  EXPECT_FALSE(report->homogeneous);
  EXPECT_EQ(report->reencode_merges, 1u);
  EXPECT_EQ(runner_->count("concat_reencode"), 1u);
  EXPECT_EQ(readFile(out), "abc");
}

TEST_F(SequentialAssemblerTest, EncoderFailureKeepsOutputAbsent) {
  runner_->fail_when = [](const CommandSpec&) { return true; };
  auto out = dir_ / "out.mp4";
  auto report = assembler_.build(segments_, out, dir_.path());
  ASSERT_FALSE(report);
  EXPECT_EQ(report.error().kind, ErrorKind::EncodeFailed);
  EXPECT_FALSE(std::filesystem::exists(out));
}

} // namespace
