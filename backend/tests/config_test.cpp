#include <gtest/gtest.h>
#include "common/config/config.hpp"

namespace {

TEST(ConfigTest, DefaultsMatchTargetProfile) {
  const auto& cfg = config::Config::getInstance();
  const auto& target = cfg.getEncoder().target;
  EXPECT_EQ(target.width, 1280);
  EXPECT_EQ(target.height, 720);
  EXPECT_EQ(target.fps, 30);
  EXPECT_EQ(target.codec_lib, "libx264");
  EXPECT_EQ(target.pix_fmt, "yuv420p");
  EXPECT_EQ(cfg.getEncoder().probe_timeout, std::chrono::seconds(10));
  EXPECT_EQ(cfg.getStreaming().direct_chunk_size, 64u * 1024u);
  EXPECT_EQ(cfg.getStreaming().startup_buffer_size, 256u * 1024u);
  EXPECT_EQ(cfg.getStreaming().startup_total_timeout, std::chrono::seconds(120));
  EXPECT_EQ(cfg.getDownload().max_parallel, 4u);
  EXPECT_EQ(cfg.getBreaks().common_durations, (std::vector<int>{5, 10, 15, 20, 25, 30, 35, 40}));
  EXPECT_FALSE(cfg.getWorkout().speed_enabled);
}

TEST(ConfigTest, OverlayChangesOnlyNamedKeys) {
  auto& cfg = config::Config::getInstance();
  auto port = cfg.getServer().port;
  auto ttl = cfg.getJobStore().ttl;

  ASSERT_TRUE(cfg.loadFromString(R"({"server": {"port": 9123}, "job_store": {"ttl": 60}, "unknown": 1})"));
  EXPECT_EQ(cfg.getServer().port, 9123);
  EXPECT_EQ(cfg.getJobStore().ttl, std::chrono::seconds(60));
  EXPECT_EQ(cfg.getServerIpPort(), cfg.getServer().host + ":9123");

  ASSERT_TRUE(cfg.loadFromString("{\"server\": {\"port\": " + std::to_string(port) +
                                 "}, \"job_store\": {\"ttl\": " + std::to_string(ttl.count()) + "}}"));
  EXPECT_EQ(cfg.getServer().port, port);
}

TEST(ConfigTest, RejectedDocumentKeepsValues) {
  auto& cfg = config::Config::getInstance();
  auto work = cfg.getWorkout().work_time;
  auto port = cfg.getServer().port;

  EXPECT_FALSE(cfg.loadFromString(R"({"server": {"port": 1}, "workout": {"work_time": 0}})"));
  EXPECT_FALSE(cfg.loadFromString(R"({"server": {"port": "eighty"}})"));
  EXPECT_FALSE(cfg.loadFromString("{not json"));
  EXPECT_EQ(cfg.getWorkout().work_time, work);
  EXPECT_EQ(cfg.getServer().port, port);
}

TEST(ConfigTest, ZeroBufferSizesAreRejected) {
  auto& cfg = config::Config::getInstance();
  auto streaming = cfg.getStreaming();

  EXPECT_FALSE(cfg.loadFromString(R"({"streaming": {"direct_chunk_size": 0}})"));
  EXPECT_FALSE(cfg.loadFromString(R"({"streaming": {"relay_chunk_size": 0}})"));
  EXPECT_FALSE(cfg.loadFromString(R"({"streaming": {"startup_buffer_size": 0}})"));
  EXPECT_FALSE(cfg.loadFromString(R"({"workout": {"max_total_duration": 0}})"));
  EXPECT_EQ(cfg.getStreaming().direct_chunk_size, streaming.direct_chunk_size);
  EXPECT_EQ(cfg.getStreaming().relay_chunk_size, streaming.relay_chunk_size);
  EXPECT_EQ(cfg.getStreaming().startup_buffer_size, streaming.startup_buffer_size);
}

TEST(ConfigTest, MissingFileIsAnError) {
  auto res = config::Config::getInstance().loadFromFile("/nonexistent/workout.json");
  ASSERT_FALSE(res);
  EXPECT_NE(res.error().find("/nonexistent/workout.json"), std::string::npos);
}

} // namespace
