#include "rest_api_handler.hpp"
#include "common/logger.hpp"
#include "infrastructure/json_exercise_catalog.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace workout_service {

namespace {
constexpr std::string_view kExercisesPrefix = "/api/exercises/";
constexpr std::string_view kStreamPrefix = "/api/stream-workout/";

http::response<http::empty_body> videoHeader() {
  http::response<http::empty_body> header{http::status::ok, 11};
  header.set(http::field::content_type, "video/mp4");
  header.set(http::field::content_disposition, "inline; filename=\"workout.mp4\"");
  header.set(http::field::cache_control, "no-cache");
  return header;
}

StreamPipeline::ChunkSink sinkFor(common::StreamWriter& writer) {
  return [&writer](std::string_view chunk) { return writer.write(chunk); };
}
}

RestApiHandler::RestApiHandler(std::shared_ptr<WorkoutService> workout_service,
                               config::WorkoutDefaults defaults, size_t file_chunk_size)
    : workout_service_(workout_service), defaults_(std::move(defaults)), file_chunk_size_(file_chunk_size) {}

common::Reply RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  std::string target = std::string(req.target());
  if (auto query = target.find('?'); query != std::string::npos) {
    target.erase(query);
  }
  auto method = req.method();

  if ((target == "/health" || target == "/api/health") && method == http::verb::get) {
    return createJsonResponse(http::status::ok,
                              {{"status", "healthy"}, {"message", "Workout video service is running"}});
  } else if (target == "/api/exercises" && method == http::verb::get) {
    return handleGetExercises();
  } else if (target.starts_with(kExercisesPrefix) && method == http::verb::get) {
    return handleGetExercise(percentDecode(target.substr(kExercisesPrefix.size())));
  } else if (target == "/api/generate-workout-video" && method == http::verb::post) {
    return handleGenerateWorkoutVideo(objectBody(req.body()));
  } else if (target == "/api/generate-auto-workout-video" && method == http::verb::post) {
    return handleGenerateAutoWorkoutVideo(objectBody(req.body()));
  } else if ((target == "/api/start-workout-generation" || target == "/start-workout-generation") &&
             method == http::verb::post) {
    return handleStartWorkoutGeneration(objectBody(req.body()));
  } else if (target.starts_with(kStreamPrefix) && method == http::verb::get) {
    return handleStreamWorkout(percentDecode(target.substr(kStreamPrefix.size())));
  } else if (target == "/api/cache/stats" && method == http::verb::get) {
    return handleCacheStats();
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

http::status RestApiHandler::statusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::AssetUnavailable:
    case ErrorKind::JobNotFound:
      return http::status::not_found;
    case ErrorKind::InvalidRequest:
      return http::status::bad_request;
    case ErrorKind::StreamTimeout:
      return http::status::gateway_timeout;
    default:
      return http::status::internal_server_error;
  }
}

std::string RestApiHandler::percentDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size() &&
        std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else if (c == '+') {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out;
}

Result<WorkoutConfig> RestApiHandler::parseWorkoutConfig(const nlohmann::json& body,
                                                         const config::WorkoutDefaults& defaults) {
  WorkoutConfig cfg;
  cfg.work_time = defaults.work_time;
  cfg.rest_time = defaults.rest_time;
  if (body.is_null()) {
    return cfg;
  }
  if (!body.is_object()) {
    return makeError(ErrorKind::InvalidRequest, "config must be an object");
  }

  try {
    if (body.contains("intensity")) {
      auto intensity = parseIntensity(body.at("intensity").get<std::string>());
      if (!intensity) {
        return makeError(ErrorKind::InvalidRequest, "unknown intensity");
      }
      cfg.intensity = *intensity;
    }
    const auto& intervals = body.contains("intervals") ? body.at("intervals") : body;
    cfg.work_time = intervals.value("work_time", cfg.work_time);
    cfg.rest_time = intervals.value("rest_time", cfg.rest_time);
    cfg.no_jump = body.value("no_jump", false);
    if (body.contains("intensity_levels")) {
      cfg.intensity_levels.clear();
      for (const auto& level : body.at("intensity_levels")) {
        auto difficulty = parseDifficulty(level.get<std::string>());
        if (!difficulty) {
          return makeError(ErrorKind::InvalidRequest, "unknown difficulty " + level.dump());
        }
        cfg.intensity_levels.push_back(*difficulty);
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return makeError(ErrorKind::InvalidRequest, std::string("invalid config: ") + e.what());
  }

  if (cfg.work_time <= 0 || cfg.rest_time <= 0) {
    return makeError(ErrorKind::InvalidRequest, "work_time and rest_time must be positive");
  }
  return cfg;
}

Result<int> RestApiHandler::totalDuration(const nlohmann::json& body) const {
  std::optional<int64_t> seconds;
  try {
    if (body.contains("total_duration")) {
      seconds = body.at("total_duration").get<int64_t>();
    } else if (body.contains("config") && body.at("config").contains("target_duration")) {
      // target_duration is in minutes
      auto minutes = body.at("config").at("target_duration").get<int64_t>();
      seconds = minutes > defaults_.max_total_duration / 60 ? int64_t{defaults_.max_total_duration} + 1
                                                             : std::max<int64_t>(minutes, 0) * 60;
    }
  } catch (const nlohmann::json::exception& e) {
    return makeError(ErrorKind::InvalidRequest, std::string("invalid total_duration: ") + e.what());
  }
  if (!seconds) {
    return makeError(ErrorKind::InvalidRequest, "total_duration is required");
  }
  if (*seconds <= 0) {
    return makeError(ErrorKind::InvalidRequest, "total_duration must be positive");
  }
  if (*seconds > defaults_.max_total_duration) {
    return makeError(ErrorKind::InvalidRequest, "total_duration must not exceed " +
                     std::to_string(defaults_.max_total_duration) + " seconds");
  }
  return static_cast<int>(*seconds);
}

nlohmann::json RestApiHandler::objectBody(const std::string& body) {
  auto json = parseRequestBody(body);
  if (!json.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
  return json;
}

http::response<http::string_body> RestApiHandler::errorResponse(const GenerationError& error) {
  common::Logger::warn("request failed: " + error.describe());
  std::string detail = error.message;
  if (!error.diagnostics.empty()) {
    detail += ": " + error.diagnostics;
  }
  return createErrorResponse(statusFor(error.kind), detail);
}

http::response<http::string_body> RestApiHandler::handleGetExercises() {
  auto list = nlohmann::json::array();
  for (const auto& exercise : workout_service_->listExercises()) {
    list.push_back(JsonExerciseCatalog::toJson(exercise));
  }
  return createJsonResponse(http::status::ok, list);
}

http::response<http::string_body> RestApiHandler::handleGetExercise(const std::string& name) {
  auto exercise = workout_service_->getExercise(name);
  if (!exercise) {
    return errorResponse(exercise.error());
  }
  return createJsonResponse(http::status::ok, JsonExerciseCatalog::toJson(exercise.value()));
}

common::Reply RestApiHandler::handleGenerateWorkoutVideo(const nlohmann::json &body) {
  std::vector<std::string> names;
  if (!body.contains("exercise_names") || !body.at("exercise_names").is_array()) {
    return createErrorResponse(http::status::bad_request, "exercise_names must be a list");
  }
  for (const auto& name : body.at("exercise_names")) {
    if (!name.is_string()) {
      return createErrorResponse(http::status::bad_request, "exercise_names must contain strings");
    }
    names.push_back(name.get<std::string>());
  }
  if (names.empty()) {
    return createErrorResponse(http::status::bad_request, "exercise_names must not be empty");
  }
  auto cfg = parseWorkoutConfig(body.value("config", nlohmann::json()), defaults_);
  if (!cfg) {
    return errorResponse(cfg.error());
  }

  common::Logger::info("generate-workout-video for " + std::to_string(names.size()) + " exercises, intensity " +
                       toString(cfg->intensity));
  auto service = workout_service_;
  return common::StreamingReply{
    videoHeader(),
    [service, names, config = cfg.value()](common::StreamWriter& writer)
        -> std::optional<http::response<http::string_body>> {
      auto res = service->streamExercises(names, config, sinkFor(writer));
      if (!res) return errorResponse(res.error());
      return std::nullopt;
    }};
}

common::Reply RestApiHandler::handleGenerateAutoWorkoutVideo(const nlohmann::json &body) {
  auto cfg = parseWorkoutConfig(body.value("config", nlohmann::json()), defaults_);
  if (!cfg) {
    return errorResponse(cfg.error());
  }
  auto total = totalDuration(body);
  if (!total) {
    return errorResponse(total.error());
  }
  auto name = body.value("name", std::string("Workout"));

  auto service = workout_service_;
  auto chunk_size = file_chunk_size_;
  return common::StreamingReply{
    videoHeader(),
    [service, chunk_size, name, config = cfg.value(), total = total.value()](common::StreamWriter& writer)
        -> std::optional<http::response<http::string_body>> {
      auto generated = service->generateWorkoutVideo(config, total, name);
      if (!generated) return errorResponse(generated.error());

      std::ifstream in(generated->output_path, std::ios::binary);
      if (!in) {
        return createErrorResponse(http::status::internal_server_error, "generated video is missing");
      }
      writer.header().set("X-Workout-ID", generated->workout_id);
      writer.header().set("X-Exercise-Count", std::to_string(generated->exercise_count));

      std::string chunk(chunk_size, '\0');
      while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        if (!writer.write(std::string_view(chunk.data(), got))) {
          return std::nullopt;
        }
      }
      return std::nullopt;
    }};
}

http::response<http::string_body> RestApiHandler::handleStartWorkoutGeneration(const nlohmann::json &body) {
  auto cfg = parseWorkoutConfig(body.value("config", nlohmann::json()), defaults_);
  if (!cfg) {
    return errorResponse(cfg.error());
  }
  auto total = totalDuration(body);
  if (!total) {
    return errorResponse(total.error());
  }
  std::optional<std::string> id;
  if (body.contains("workout_id") && body.at("workout_id").is_string()) {
    id = body.at("workout_id").get<std::string>();
  }

  auto staged = workout_service_->prepareWorkout(cfg.value(), total.value(),
                                                 body.value("name", std::string("Workout")), id);
  if (!staged) {
    return errorResponse(staged.error());
  }
  nlohmann::json response_json = {{"workout_id", staged->workout_id},
                                  {"total_exercises", staged->total_exercises},
                                  {"stream_url", staged->stream_url}};
  return createJsonResponse(http::status::ok, response_json);
}

common::Reply RestApiHandler::handleStreamWorkout(const std::string& workout_id) {
  if (workout_id.empty()) {
    return createErrorResponse(http::status::not_found, "Workout not found");
  }
  auto service = workout_service_;
  auto header = videoHeader();
  header.set("X-Workout-ID", workout_id);
  return common::StreamingReply{
    std::move(header),
    [service, workout_id](common::StreamWriter& writer)
        -> std::optional<http::response<http::string_body>> {
      auto res = service->streamWorkout(workout_id, sinkFor(writer));
      if (!res) return errorResponse(res.error());
      return std::nullopt;
    }};
}

http::response<http::string_body> RestApiHandler::handleCacheStats() {
  auto stats = workout_service_->cacheStats();
  auto to_mb = [](uintmax_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); };
  nlohmann::json response_json = {
    {"video_cache", {{"count", stats.assets.files}, {"size_mb", to_mb(stats.assets.bytes)}}},
    {"break_cache", {{"count", stats.breaks.files},
                     {"size_mb", to_mb(stats.breaks.bytes)},
                     {"durations", stats.breaks.durations}}}
  };
  return createJsonResponse(http::status::ok, response_json);
}

} // namespace workout_service
