#pragma once
#include "application/workout_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace workout_service {

class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<WorkoutService> workout_service, config::WorkoutDefaults defaults,
                 size_t file_chunk_size);

  // Accepts the flat form (work_time, rest_time) and the nested "intervals"
  // object. Missing fields take the configured defaults.
  static Result<WorkoutConfig> parseWorkoutConfig(const nlohmann::json& body,
                                                  const config::WorkoutDefaults& defaults);
  static http::status statusFor(ErrorKind kind);
  static std::string percentDecode(const std::string& text);

protected:
  common::Reply doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<WorkoutService> workout_service_;
  config::WorkoutDefaults defaults_;
  size_t file_chunk_size_;

  http::response<http::string_body> handleGetExercises();
  http::response<http::string_body> handleGetExercise(const std::string& name);
  common::Reply handleGenerateWorkoutVideo(const nlohmann::json &body);
  common::Reply handleGenerateAutoWorkoutVideo(const nlohmann::json &body);
  http::response<http::string_body> handleStartWorkoutGeneration(const nlohmann::json &body);
  common::Reply handleStreamWorkout(const std::string& workout_id);
  http::response<http::string_body> handleCacheStats();

  static http::response<http::string_body> errorResponse(const GenerationError& error);
  nlohmann::json objectBody(const std::string& body);
  Result<int> totalDuration(const nlohmann::json& body) const;
};

} // namespace workout_service
