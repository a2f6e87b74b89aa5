#pragma once
#include "domain/job_store.hpp"
#include <functional>
#include <mutex>
#include <unordered_map>

namespace workout_service {

// In-process JobStore. Expired entries are dropped on access, on every put()
// and by evictExpired().
class MemoryJobStore : public JobStore {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  explicit MemoryJobStore(Clock clock = [] { return std::chrono::steady_clock::now(); });

  void put(const StoredWorkout& workout, std::chrono::seconds ttl) override;
  std::optional<StoredWorkout> get(const std::string& id) override;
  bool remove(const std::string& id) override;
  size_t size() override;

  size_t evictExpired();

private:
  struct Entry {
    StoredWorkout workout;
    std::chrono::steady_clock::time_point expires_at;
  };

  size_t evictLocked(std::chrono::steady_clock::time_point now);

  Clock clock_;
  std::mutex mtx_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace workout_service
