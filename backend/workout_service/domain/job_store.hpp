#pragma once

// project
#include "exercise.hpp"
#include "video.hpp"

// std
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace workout_service {

// Everything needed to rebuild the encoder command of a staged workout.
struct StoredWorkout {
  std::string id;
  std::string name;
  WorkoutSpec spec;
  std::vector<ResolvedAsset> assets;  // same order as spec.exercises
  std::chrono::system_clock::time_point created_at;
};

class JobStore {
public:
  virtual ~JobStore() = default;
  virtual void put(const StoredWorkout& workout, std::chrono::seconds ttl) = 0;
  // nullopt for unknown and expired ids.
  virtual std::optional<StoredWorkout> get(const std::string& id) = 0;
  virtual bool remove(const std::string& id) = 0;
  virtual size_t size() = 0;
};

} // namespace workout_service
