#pragma once
#include "domain/exercise_catalog.hpp"
#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace workout_service {

// Catalog read once from a JSON array of exercise objects.
class JsonExerciseCatalog : public ExerciseCatalog {
public:
  explicit JsonExerciseCatalog(std::vector<ExerciseRecord> records);

  static std::expected<JsonExerciseCatalog, std::string> fromFile(const std::string& path);
  static std::expected<JsonExerciseCatalog, std::string> fromJson(const nlohmann::json& doc);

  std::vector<ExerciseRecord> list() const override;
  Result<ExerciseRecord> get(const std::string& id_or_name) const override;

  static nlohmann::json toJson(const ExerciseRecord& record);

private:
  std::vector<ExerciseRecord> records_;
};

} // namespace workout_service
