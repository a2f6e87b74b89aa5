#include "json_exercise_catalog.hpp"
#include "common/ids.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace workout_service {

namespace {
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}
}

JsonExerciseCatalog::JsonExerciseCatalog(std::vector<ExerciseRecord> records) : records_(std::move(records)) {}

std::expected<JsonExerciseCatalog, std::string> JsonExerciseCatalog::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected("cannot open exercise catalog " + path);
  }
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    return std::unexpected("exercise catalog " + path + " is not valid JSON");
  }
  return fromJson(doc);
}

std::expected<JsonExerciseCatalog, std::string> JsonExerciseCatalog::fromJson(const nlohmann::json& doc) {
  const nlohmann::json* items = &doc;
  if (doc.is_object() && doc.contains("exercises")) {
    items = &doc["exercises"];
  }
  if (!items->is_array()) {
    return std::unexpected("exercise catalog must be a JSON array");
  }

  std::vector<ExerciseRecord> records;
  try {
    for (const auto& item : *items) {
      ExerciseRecord r;
      r.id = item.value("id", std::string());
      if (r.id.empty()) {
        r.id = common::newUuid();
      }
      r.name = item.at("name").get<std::string>();
      r.description = item.value("description", std::string());
      r.video_url = item.value("video_url", std::string());
      r.default_duration = item.value("default_duration", 30);
      auto difficulty = parseDifficulty(item.value("difficulty", std::string("medium")));
      if (!difficulty) {
        return std::unexpected("exercise '" + r.name + "' has an unknown difficulty");
      }
      r.difficulty = *difficulty;
      r.has_jump = item.value("has_jump", false);
      records.push_back(std::move(r));
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(std::string("malformed exercise entry: ") + e.what());
  }

  common::Logger::info("loaded " + std::to_string(records.size()) + " exercises");
  return JsonExerciseCatalog(std::move(records));
}

std::vector<ExerciseRecord> JsonExerciseCatalog::list() const {
  return records_;
}

Result<ExerciseRecord> JsonExerciseCatalog::get(const std::string& id_or_name) const {
  for (const auto& r : records_) {
    if (r.id == id_or_name) return r;
  }
  auto wanted = lower(id_or_name);
  for (const auto& r : records_) {
    if (lower(r.name) == wanted) return r;
  }
  return makeError(ErrorKind::AssetUnavailable, "Exercise '" + id_or_name + "' not found");
}

nlohmann::json JsonExerciseCatalog::toJson(const ExerciseRecord& record) {
  return {
    {"id", record.id},
    {"name", record.name},
    {"description", record.description},
    {"video_url", record.video_url},
    {"default_duration", record.default_duration},
    {"difficulty", toString(record.difficulty)},
    {"has_jump", record.has_jump}
  };
}

} // namespace workout_service
