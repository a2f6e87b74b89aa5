#include <gtest/gtest.h>
#include "infrastructure/memory_job_store.hpp"

namespace {

using namespace workout_service;
using namespace std::chrono_literals;

class MemoryJobStoreTest : public ::testing::Test {
protected:
  StoredWorkout workout(const std::string& id) {
    StoredWorkout w;
    w.id = id;
    w.name = "Morning";
    w.spec.work_time = 30;
    return w;
  }

  std::chrono::steady_clock::time_point now_{};
  MemoryJobStore store_{[this] { return now_; }};
};

TEST_F(MemoryJobStoreTest, StoresUntilTtl) {
  store_.put(workout("a"), 60s);
  auto found = store_.get("a");
  ASSERT_TRUE(found);
  EXPECT_EQ(found->name, "Morning");
  EXPECT_EQ(found->spec.work_time, 30);

  now_ += 59s;
  EXPECT_TRUE(store_.get("a"));
  now_ += 1s;
  EXPECT_FALSE(store_.get("a"));
  EXPECT_EQ(store_.size(), 0u);
}

TEST_F(MemoryJobStoreTest, UnknownIdIsAbsent) {
  EXPECT_FALSE(store_.get("missing"));
  EXPECT_FALSE(store_.remove("missing"));
}

TEST_F(MemoryJobStoreTest, EvictExpiredDropsOnlyStaleEntries) {
  store_.put(workout("short"), 10s);
  store_.put(workout("long"), 100s);
  now_ += 50s;
  EXPECT_EQ(store_.evictExpired(), 1u);
  EXPECT_EQ(store_.size(), 1u);
  EXPECT_TRUE(store_.get("long"));
}

TEST_F(MemoryJobStoreTest, StagingSweepsWorkoutsThatWereNeverRead) {
  store_.put(workout("a"), 10s);
  store_.put(workout("b"), 10s);
  EXPECT_EQ(store_.size(), 2u);
  now_ += 11s;
  store_.put(workout("c"), 10s);
  EXPECT_EQ(store_.size(), 1u);
  EXPECT_TRUE(store_.get("c"));
}

TEST_F(MemoryJobStoreTest, PutReplacesAndRefreshes) {
  store_.put(workout("a"), 10s);
  now_ += 5s;
  auto updated = workout("a");
  updated.name = "Evening";
  store_.put(updated, 10s);
  now_ += 8s;
  auto found = store_.get("a");
  ASSERT_TRUE(found);
  EXPECT_EQ(found->name, "Evening");
  EXPECT_TRUE(store_.remove("a"));
  EXPECT_FALSE(store_.get("a"));
}

} // namespace
