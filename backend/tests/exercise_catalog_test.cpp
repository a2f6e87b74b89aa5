#include <gtest/gtest.h>
#include "infrastructure/json_exercise_catalog.hpp"
#include "test_helpers.hpp"

namespace {

using namespace workout_service;

TEST(ExerciseCatalogTest, LoadsArrayWithDefaults) {
  auto catalog = JsonExerciseCatalog::fromJson(nlohmann::json::parse(R"([
    {"id": "1", "name": "Burpee", "video_url": "https://cdn.example.com/burpee.mp4",
     "difficulty": "hard", "has_jump": true, "default_duration": 45},
    {"name": "Wall Sit", "video_url": "videos/wall_sit.mov"}
  ])"));
  ASSERT_TRUE(catalog) << catalog.error();
  auto list = catalog->list();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].difficulty, Difficulty::Hard);
  EXPECT_TRUE(list[0].has_jump);
  EXPECT_TRUE(list[0].isRemote());
  EXPECT_EQ(list[0].default_duration, 45);
  EXPECT_FALSE(list[1].id.empty());
  EXPECT_EQ(list[1].difficulty, Difficulty::Medium);
  EXPECT_FALSE(list[1].has_jump);
  EXPECT_FALSE(list[1].isRemote());
}

TEST(ExerciseCatalogTest, AcceptsWrappedObject) {
  auto catalog = JsonExerciseCatalog::fromJson(
    nlohmann::json::parse(R"({"exercises": [{"name": "Plank", "video_url": "plank.mov"}]})"));
  ASSERT_TRUE(catalog);
  EXPECT_EQ(catalog->list().size(), 1u);
}

TEST(ExerciseCatalogTest, RejectsMalformedEntries) {
  EXPECT_FALSE(JsonExerciseCatalog::fromJson(nlohmann::json::parse(R"({"name": "x"})")));
  EXPECT_FALSE(JsonExerciseCatalog::fromJson(nlohmann::json::parse(R"([{"video_url": "x.mov"}])")));
  EXPECT_FALSE(JsonExerciseCatalog::fromJson(nlohmann::json::parse(R"([{"name": "x", "difficulty": "brutal"}])")));
  EXPECT_FALSE(JsonExerciseCatalog::fromFile("/nonexistent/exercises.json"));
}

TEST(ExerciseCatalogTest, LookupByIdOrNameIgnoringCase) {
  JsonExerciseCatalog catalog({ExerciseRecord{"id-7", "Jump Squat", "", "js.mov", 30, Difficulty::Hard, true}});
  auto by_id = catalog.get("id-7");
  ASSERT_TRUE(by_id);
  EXPECT_EQ(by_id->name, "Jump Squat");
  EXPECT_TRUE(catalog.get("jump squat"));

  auto missing = catalog.get("Handstand");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().kind, ErrorKind::AssetUnavailable);
  EXPECT_EQ(missing.error().message, "Exercise 'Handstand' not found");
}

TEST(ExerciseCatalogTest, FromFileAndToJson) {
  workout_test::TempDir dir;
  workout_test::writeFile(dir / "exercises.json",
                          R"([{"id": "a", "name": "Lunge", "video_url": "l.mov", "difficulty": "easy"}])");
  auto catalog = JsonExerciseCatalog::fromFile((dir / "exercises.json").string());
  ASSERT_TRUE(catalog) << catalog.error();
  auto json = JsonExerciseCatalog::toJson(catalog->list().at(0));
  EXPECT_EQ(json["id"], "a");
  EXPECT_EQ(json["difficulty"], "easy");
  EXPECT_EQ(json["has_jump"], false);

  workout_test::writeFile(dir / "broken.json", "[{");
  EXPECT_FALSE(JsonExerciseCatalog::fromFile((dir / "broken.json").string()));
}

} // namespace
