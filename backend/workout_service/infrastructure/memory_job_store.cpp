#include "memory_job_store.hpp"

namespace workout_service {

MemoryJobStore::MemoryJobStore(Clock clock) : clock_(std::move(clock)) {}

void MemoryJobStore::put(const StoredWorkout& workout, std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto now = clock_();
  evictLocked(now);
  entries_[workout.id] = Entry{workout, now + ttl};
}

std::optional<StoredWorkout> MemoryJobStore::get(const std::string& id) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (it->second.expires_at <= clock_()) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.workout;
}

bool MemoryJobStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock{mtx_};
  return entries_.erase(id) > 0;
}

size_t MemoryJobStore::size() {
  std::lock_guard<std::mutex> lock{mtx_};
  return entries_.size();
}

size_t MemoryJobStore::evictExpired() {
  std::lock_guard<std::mutex> lock{mtx_};
  return evictLocked(clock_());
}

size_t MemoryJobStore::evictLocked(std::chrono::steady_clock::time_point now) {
  size_t evicted = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  return evicted;
}

} // namespace workout_service
