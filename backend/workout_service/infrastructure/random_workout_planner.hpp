#pragma once
#include "domain/workout_planner.hpp"
#include <mutex>
#include <optional>
#include <random>

namespace workout_service {

// Filters the pool by the jump and difficulty constraints and draws
// exercises uniformly with replacement.
class RandomWorkoutPlanner : public WorkoutPlanner {
public:
  RandomWorkoutPlanner(int seconds_per_exercise, bool count_from_intervals,
                       std::optional<unsigned int> seed = std::nullopt);

  Result<std::vector<ExerciseRecord>> plan(const std::vector<ExerciseRecord>& pool,
                                           const PlanConstraints& constraints) override;

  // total / seconds_per_exercise, or total / (work + rest) when configured.
  int exerciseCount(const PlanConstraints& constraints) const;

private:
  int seconds_per_exercise_;
  bool count_from_intervals_;
  std::mutex mtx_;
  std::mt19937 rng_;
};

} // namespace workout_service
