#pragma once
#include "errors.hpp"
#include "exercise.hpp"
#include <vector>

namespace workout_service {

struct PlanConstraints {
  WorkoutConfig config;
  int total_duration{0};  // seconds
};

class WorkoutPlanner {
public:
  virtual ~WorkoutPlanner() = default;
  virtual Result<std::vector<ExerciseRecord>> plan(const std::vector<ExerciseRecord>& pool,
                                                   const PlanConstraints& constraints) = 0;
};

} // namespace workout_service
