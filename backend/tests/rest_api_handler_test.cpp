#include <gtest/gtest.h>
#include "interface/rest_api_handler.hpp"
#include "test_helpers.hpp"

namespace {

using namespace workout_service;
using workout_test::ServiceHarness;

using StringResponse = http::response<http::string_body>;

class CollectingWriter : public common::StreamWriter {
public:
  explicit CollectingWriter(http::response<http::empty_body> header) : header_(std::move(header)) {}

  http::response<http::empty_body>& header() override { return header_; }
  bool write(std::string_view chunk) override {
    body.append(chunk);
    return true;
  }
  bool started() const override { return !body.empty(); }

  std::string body;

private:
  http::response<http::empty_body> header_;
};

class RestApiHandlerTest : public ::testing::Test {
protected:
  common::Reply send(http::verb verb, const std::string& target, const std::string& body = "") {
    http::request<http::string_body> req{verb, target, 11};
    req.body() = body;
    req.prepare_payload();
    return handler_.handleRequest(std::move(req));
  }

  StringResponse plain(common::Reply reply) {
    EXPECT_TRUE(std::holds_alternative<StringResponse>(reply));
    return std::get<StringResponse>(std::move(reply));
  }

  nlohmann::json json(const StringResponse& res) { return nlohmann::json::parse(res.body()); }

  ServiceHarness h_;
  RestApiHandler handler_{h_.service, h_.defaults, 4};
};

TEST_F(RestApiHandlerTest, HealthAndCors) {
  auto res = plain(send(http::verb::get, "/health"));
  EXPECT_EQ(res.result(), http::status::ok);
  EXPECT_EQ(json(res)["status"], "healthy");
  EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
  EXPECT_EQ(res[http::field::content_type], "application/json");

  auto preflight = plain(send(http::verb::options, "/api/start-workout-generation"));
  EXPECT_EQ(preflight.result(), http::status::no_content);
}

TEST_F(RestApiHandlerTest, UnknownRouteIsNotFound) {
  auto res = plain(send(http::verb::get, "/api/unknown"));
  EXPECT_EQ(res.result(), http::status::not_found);
  EXPECT_EQ(json(res)["detail"], "Endpoint not found");
  EXPECT_EQ(plain(send(http::verb::delete_, "/health")).result(), http::status::not_found);
}

TEST_F(RestApiHandlerTest, ExerciseLookup) {
  auto all = plain(send(http::verb::get, "/api/exercises"));
  EXPECT_EQ(all.result(), http::status::ok);
  EXPECT_EQ(json(all).size(), 3u);

  auto one = plain(send(http::verb::get, "/api/exercises/jump%20lunge"));
  EXPECT_EQ(one.result(), http::status::ok);
  EXPECT_EQ(json(one)["id"], "ex-lunge");
  EXPECT_EQ(json(one)["has_jump"], true);

  auto missing = plain(send(http::verb::get, "/api/exercises/Handstand"));
  EXPECT_EQ(missing.result(), http::status::not_found);
  EXPECT_EQ(json(missing)["detail"], "Exercise 'Handstand' not found");
}

TEST_F(RestApiHandlerTest, StartThenStreamWorkout) {
  auto started = plain(send(http::verb::post, "/api/start-workout-generation",
                            R"({"total_duration": 180, "config": {"intervals": {"work_time": 30, "rest_time": 20}}})"));
  ASSERT_EQ(started.result(), http::status::ok) << started.body();
  auto body = json(started);
  EXPECT_EQ(body["total_exercises"], 3);
  auto id = body["workout_id"].get<std::string>();
  EXPECT_EQ(body["stream_url"], "/api/stream-workout/" + id);

  auto reply = send(http::verb::get, body["stream_url"].get<std::string>());
  ASSERT_TRUE(std::holds_alternative<common::StreamingReply>(reply));
  auto& stream = std::get<common::StreamingReply>(reply);
  EXPECT_EQ(stream.header[http::field::content_type], "video/mp4");
  EXPECT_EQ(stream.header["X-Workout-ID"], id);

  CollectingWriter writer(stream.header);
  EXPECT_FALSE(stream.produce(writer));
  EXPECT_EQ(writer.body, "stream-bytes");
}

TEST_F(RestApiHandlerTest, StreamOfUnknownWorkoutReportsNotFound) {
  auto reply = send(http::verb::get, "/api/stream-workout/does-not-exist");
  ASSERT_TRUE(std::holds_alternative<common::StreamingReply>(reply));
  auto& stream = std::get<common::StreamingReply>(reply);
  CollectingWriter writer(stream.header);
  auto error = stream.produce(writer);
  ASSERT_TRUE(error);
  EXPECT_EQ(error->result(), http::status::not_found);
  EXPECT_TRUE(writer.body.empty());
}

TEST_F(RestApiHandlerTest, AutoWorkoutSetsHeadersBeforeBody) {
  auto reply = send(http::verb::post, "/api/generate-auto-workout-video",
                    R"({"config": {"target_duration": 2, "work_time": 40, "rest_time": 20}})");
  ASSERT_TRUE(std::holds_alternative<common::StreamingReply>(reply));
  auto& stream = std::get<common::StreamingReply>(reply);
  CollectingWriter writer(stream.header);
  EXPECT_FALSE(stream.produce(writer));
  EXPECT_FALSE(writer.body.empty());
  EXPECT_NE(writer.body.find("[break:20]"), std::string::npos);
  EXPECT_EQ(writer.header()["X-Exercise-Count"], "2");
  EXPECT_FALSE(writer.header()["X-Workout-ID"].empty());
  EXPECT_TRUE(h_.tempRootEmpty());
}

TEST_F(RestApiHandlerTest, NamedExercisesStream) {
  auto reply = send(http::verb::post, "/api/generate-workout-video",
                    R"({"exercise_names": ["Squat", "Plank"], "config": {"intensity": "low_impact"}})");
  ASSERT_TRUE(std::holds_alternative<common::StreamingReply>(reply));
  auto& stream = std::get<common::StreamingReply>(reply);
  CollectingWriter writer(stream.header);
  EXPECT_FALSE(stream.produce(writer));
  EXPECT_EQ(writer.body, "stream-bytes");
}

TEST_F(RestApiHandlerTest, BadRequests) {
  EXPECT_EQ(plain(send(http::verb::post, "/api/start-workout-generation", "{oops")).result(),
            http::status::bad_request);
  EXPECT_EQ(plain(send(http::verb::post, "/api/start-workout-generation", "[1]")).result(),
            http::status::bad_request);
  EXPECT_EQ(plain(send(http::verb::post, "/api/start-workout-generation", "{}")).result(),
            http::status::bad_request);
  EXPECT_EQ(plain(send(http::verb::post, "/api/generate-workout-video", R"({"exercise_names": "Squat"})")).result(),
            http::status::bad_request);
  EXPECT_EQ(plain(send(http::verb::post, "/api/generate-workout-video", R"({"exercise_names": []})")).result(),
            http::status::bad_request);
  EXPECT_EQ(plain(send(http::verb::post, "/api/start-workout-generation",
                       R"({"total_duration": 180, "config": {"intensity": "extreme"}})")).result(),
            http::status::bad_request);
}

TEST_F(RestApiHandlerTest, DurationsAboveTheLimitAreRejected) {
  auto over = plain(send(http::verb::post, "/api/start-workout-generation", R"({"total_duration": 3601})"));
  EXPECT_EQ(over.result(), http::status::bad_request);
  EXPECT_NE(json(over)["detail"].get<std::string>().find("3600"), std::string::npos);

  // 60 * 2^31 minutes would overflow a 32-bit product
  auto minutes = plain(send(http::verb::post, "/api/start-workout-generation",
                            R"({"config": {"target_duration": 2147483647}})"));
  EXPECT_EQ(minutes.result(), http::status::bad_request);

  auto huge = plain(send(http::verb::post, "/api/start-workout-generation",
                         R"({"total_duration": 9000000000000})"));
  EXPECT_EQ(huge.result(), http::status::bad_request);

  auto negative = plain(send(http::verb::post, "/api/start-workout-generation",
                             R"({"config": {"target_duration": -5}})"));
  EXPECT_EQ(negative.result(), http::status::bad_request);

  EXPECT_EQ(h_.store->size(), 0u);

  auto at_limit = plain(send(http::verb::post, "/api/start-workout-generation",
                             R"({"config": {"target_duration": 60}})"));
  EXPECT_EQ(at_limit.result(), http::status::ok) << at_limit.body();
}

TEST_F(RestApiHandlerTest, CacheStats) {
  auto res = plain(send(http::verb::get, "/api/cache/stats"));
  EXPECT_EQ(res.result(), http::status::ok);
  auto body = json(res);
  EXPECT_EQ(body["video_cache"]["count"], 0);
  EXPECT_TRUE(body["break_cache"]["durations"].is_array());
}

TEST(RestApiHelpersTest, ParseWorkoutConfigForms) {
  auto defaults = ServiceHarness::testDefaults();

  auto fallback = RestApiHandler::parseWorkoutConfig(nlohmann::json(), defaults);
  ASSERT_TRUE(fallback);
  EXPECT_EQ(fallback->work_time, defaults.work_time);
  EXPECT_EQ(fallback->intensity, Intensity::MediumIntensity);

  auto nested = RestApiHandler::parseWorkoutConfig(
    nlohmann::json::parse(R"({"intensity": "high_intensity", "intervals": {"work_time": 45, "rest_time": 15},
                              "no_jump": true, "intensity_levels": ["easy"]})"),
    defaults);
  ASSERT_TRUE(nested);
  EXPECT_EQ(nested->intensity, Intensity::HighIntensity);
  EXPECT_EQ(nested->work_time, 45);
  EXPECT_EQ(nested->rest_time, 15);
  EXPECT_TRUE(nested->no_jump);
  EXPECT_EQ(nested->intensity_levels, std::vector<Difficulty>{Difficulty::Easy});

  auto flat = RestApiHandler::parseWorkoutConfig(nlohmann::json::parse(R"({"work_time": 50})"), defaults);
  ASSERT_TRUE(flat);
  EXPECT_EQ(flat->work_time, 50);
  EXPECT_EQ(flat->rest_time, defaults.rest_time);

  EXPECT_FALSE(RestApiHandler::parseWorkoutConfig(nlohmann::json::parse(R"({"work_time": 0})"), defaults));
  EXPECT_FALSE(RestApiHandler::parseWorkoutConfig(nlohmann::json::parse(R"({"work_time": "long"})"), defaults));
  EXPECT_FALSE(RestApiHandler::parseWorkoutConfig(nlohmann::json::parse(R"({"intensity_levels": ["insane"]})"),
                                                  defaults));
}

TEST(RestApiHelpersTest, ErrorKindsMapToStatus) {
  EXPECT_EQ(RestApiHandler::statusFor(ErrorKind::AssetUnavailable), http::status::not_found);
  EXPECT_EQ(RestApiHandler::statusFor(ErrorKind::JobNotFound), http::status::not_found);
  EXPECT_EQ(RestApiHandler::statusFor(ErrorKind::InvalidRequest), http::status::bad_request);
  EXPECT_EQ(RestApiHandler::statusFor(ErrorKind::StreamTimeout), http::status::gateway_timeout);
  EXPECT_EQ(RestApiHandler::statusFor(ErrorKind::EncodeFailed), http::status::internal_server_error);
}

TEST(RestApiHelpersTest, PercentDecoding) {
  EXPECT_EQ(RestApiHandler::percentDecode("Jump%20Squat"), "Jump Squat");
  EXPECT_EQ(RestApiHandler::percentDecode("a+b"), "a b");
  EXPECT_EQ(RestApiHandler::percentDecode("100%"), "100%");
  EXPECT_EQ(RestApiHandler::percentDecode("%zz"), "%zz");
}

} // namespace
