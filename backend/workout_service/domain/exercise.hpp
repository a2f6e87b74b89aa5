#pragma once
#include <optional>
#include <string>
#include <vector>

namespace workout_service {

enum class Difficulty { Easy, Medium, Hard };

enum class Intensity { LowImpact, MediumIntensity, HighIntensity };

inline const char* toString(Difficulty d) {
  switch (d) {
    case Difficulty::Easy: return "easy";
    case Difficulty::Medium: return "medium";
    case Difficulty::Hard: return "hard";
  }
  return "medium";
}

inline std::optional<Difficulty> parseDifficulty(const std::string& s) {
  if (s == "easy") return Difficulty::Easy;
  if (s == "medium") return Difficulty::Medium;
  if (s == "hard") return Difficulty::Hard;
  return std::nullopt;
}

inline const char* toString(Intensity i) {
  switch (i) {
    case Intensity::LowImpact: return "low_impact";
    case Intensity::MediumIntensity: return "medium_intensity";
    case Intensity::HighIntensity: return "high_intensity";
  }
  return "medium_intensity";
}

inline std::optional<Intensity> parseIntensity(const std::string& s) {
  if (s == "low_impact") return Intensity::LowImpact;
  if (s == "medium_intensity") return Intensity::MediumIntensity;
  if (s == "high_intensity") return Intensity::HighIntensity;
  return std::nullopt;
}

// Catalog entry. Immutable once loaded.
struct ExerciseRecord {
  std::string id;
  std::string name;
  std::string description;
  std::string video_url;   // filesystem path or http(s) URL
  int default_duration{0};
  Difficulty difficulty{Difficulty::Medium};
  bool has_jump{false};

  bool isRemote() const {
    return video_url.rfind("http://", 0) == 0 || video_url.rfind("https://", 0) == 0;
  }
};

// What the caller asks for; the planner and the orchestrator turn it into a
// WorkoutSpec.
struct WorkoutConfig {
  Intensity intensity{Intensity::MediumIntensity};
  int work_time{40};
  int rest_time{20};
  bool no_jump{false};
  std::vector<Difficulty> intensity_levels{Difficulty::Easy, Difficulty::Medium, Difficulty::Hard};
};

struct WorkoutSpec {
  std::vector<ExerciseRecord> exercises;
  double speed_multiplier{1.0};
  int work_time{40};
  int rest_time{20};

  bool valid() const {
    return work_time > 0 && rest_time > 0 && speed_multiplier > 0.0;
  }
  // Nominal duration: every exercise plus a break between consecutive ones.
  int expectedDuration() const {
    if (exercises.empty()) return 0;
    auto n = static_cast<int>(exercises.size());
    return n * work_time + (n - 1) * rest_time;
  }
};

} // namespace workout_service
