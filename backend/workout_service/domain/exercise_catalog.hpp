#pragma once
#include "errors.hpp"
#include "exercise.hpp"
#include <vector>

namespace workout_service {

class ExerciseCatalog {
public:
  virtual ~ExerciseCatalog() = default;
  virtual std::vector<ExerciseRecord> list() const = 0;
  // Matches the id exactly or the name case-insensitively.
  virtual Result<ExerciseRecord> get(const std::string& id_or_name) const = 0;
};

} // namespace workout_service
