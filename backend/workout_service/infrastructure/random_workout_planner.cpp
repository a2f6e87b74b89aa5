#include "random_workout_planner.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace workout_service {

RandomWorkoutPlanner::RandomWorkoutPlanner(int seconds_per_exercise, bool count_from_intervals,
                                           std::optional<unsigned int> seed)
  : seconds_per_exercise_(seconds_per_exercise > 0 ? seconds_per_exercise : 60),
    count_from_intervals_(count_from_intervals),
    rng_(seed ? *seed : std::random_device{}()) {}

int RandomWorkoutPlanner::exerciseCount(const PlanConstraints& constraints) const {
  int per_exercise = seconds_per_exercise_;
  if (count_from_intervals_) {
    per_exercise = constraints.config.work_time + constraints.config.rest_time;
  }
  return per_exercise > 0 ? constraints.total_duration / per_exercise : 0;
}

Result<std::vector<ExerciseRecord>> RandomWorkoutPlanner::plan(const std::vector<ExerciseRecord>& pool,
                                                               const PlanConstraints& constraints) {
  const auto& cfg = constraints.config;
  std::vector<ExerciseRecord> candidates;
  for (const auto& r : pool) {
    if (cfg.no_jump && r.has_jump) continue;
    if (std::find(cfg.intensity_levels.begin(), cfg.intensity_levels.end(), r.difficulty) ==
        cfg.intensity_levels.end()) {
      continue;
    }
    candidates.push_back(r);
  }
  if (candidates.empty()) {
    return makeError(ErrorKind::InvalidRequest, "No exercises match the specified criteria");
  }

  int count = exerciseCount(constraints);
  if (count <= 0) {
    return makeError(ErrorKind::InvalidRequest, "Total duration too short for any exercise");
  }

  std::vector<ExerciseRecord> picked;
  picked.reserve(static_cast<size_t>(count));
  {
    std::lock_guard<std::mutex> lock{mtx_};
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    for (int i = 0; i < count; ++i) {
      picked.push_back(candidates[dist(rng_)]);
    }
  }
  common::Logger::debug("planned " + std::to_string(count) + " exercises from " +
                        std::to_string(candidates.size()) + " candidates");
  return picked;
}

} // namespace workout_service
