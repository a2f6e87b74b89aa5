#include "config.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace config {

namespace {

using json = nlohmann::json;

template <typename T>
void overlay(const json& j, const char* key, T& out) {
  if (j.contains(key)) {
    out = j.at(key).get<T>();
  }
}

void overlay(const json& j, const char* key, std::chrono::seconds& out) {
  if (j.contains(key)) {
    out = std::chrono::seconds(j.at(key).get<long long>());
  }
}

} // namespace

  Config::Config() {
    server_ = {
      .host = "0.0.0.0",
      .port = 8000,
      .io_threads = 2,
      .stream_workers = 8
    };

    storage_ = {
      .project_root = ".",
      .local_assets_dir = "./exercices_generation/outputs",
      .cache_dir = "/tmp/exercise_videos",
      .break_cache_dir = "/tmp/exercise_videos/breaks_cache",
      .temp_root = "/tmp/workout_jobs",
      .catalog_path = "./data/exercises.json",
      .break_image_candidates = {"./sport_room.png", "./backend/sport_room.png", "/app/sport_room.png"}
    };

    encoder_ = {
      .ffmpeg_path = "ffmpeg",
      .ffprobe_path = "ffprobe",
      .prober = "ffprobe",
      .target = {
        .width = 1280,
        .height = 720,
        .fps = 30,
        .codec_lib = "libx264",
        .codec = "h264",
        .preset = "ultrafast",
        .crf = 23,
        .pix_fmt = "yuv420p"
      },
      .encode_timeout = std::chrono::seconds(600),
      .probe_timeout = std::chrono::seconds(10)
    };

    streaming_ = {
      .direct_chunk_size = 64 * 1024,
      .direct_read_timeout = std::chrono::seconds(300),
      .direct_total_timeout = std::chrono::seconds(300),
      .startup_buffer_size = 256 * 1024,
      .startup_read_timeout = std::chrono::seconds(30),
      .startup_total_timeout = std::chrono::seconds(120),
      .relay_chunk_size = 256 * 1024,
      .relay_read_timeout = std::chrono::seconds(60)
    };

    download_ = {
      .max_parallel = 4,
      .timeout = std::chrono::seconds(120),
      .chunk_size = 64 * 1024,
      .auth_token = ""
    };

    breaks_ = {
      .common_durations = {5, 10, 15, 20, 25, 30, 35, 40}
    };

    workout_ = {
      .work_time = 40,
      .rest_time = 20,
      .speed_enabled = false,
      .speed_multipliers = {
        {"low_impact", 0.8},
        {"medium_intensity", 1.0},
        {"high_intensity", 1.2}
      },
      .seconds_per_exercise = 60,
      .count_from_intervals = false,
      .max_total_duration = 4 * 3600
    };

    job_store_ = {
      .ttl = std::chrono::seconds(3600)
    };

    log_level_ = "info";
  }

  std::expected<void, std::string> Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
      return std::unexpected("Failed to open config file: " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return loadFromString(ss.str());
  }

  std::expected<void, std::string> Config::loadFromString(const std::string& json_text) {
    json root;
    try {
      root = json::parse(json_text);
    } catch (const json::parse_error& e) {
      return std::unexpected(std::string("Invalid config JSON: ") + e.what());
    }

    // A rejected document leaves the current values untouched.
    auto server = server_;
    auto storage = storage_;
    auto encoder = encoder_;
    auto streaming = streaming_;
    auto download = download_;
    auto breaks = breaks_;
    auto workout = workout_;
    auto job_store = job_store_;
    auto log_level = log_level_;

    try {
      if (root.contains("server")) {
        const auto& j = root["server"];
        overlay(j, "host", server.host);
        overlay(j, "port", server.port);
        overlay(j, "io_threads", server.io_threads);
        overlay(j, "stream_workers", server.stream_workers);
      }
      if (root.contains("storage")) {
        const auto& j = root["storage"];
        overlay(j, "project_root", storage.project_root);
        overlay(j, "local_assets_dir", storage.local_assets_dir);
        overlay(j, "cache_dir", storage.cache_dir);
        overlay(j, "break_cache_dir", storage.break_cache_dir);
        overlay(j, "temp_root", storage.temp_root);
        overlay(j, "catalog_path", storage.catalog_path);
        overlay(j, "break_image_candidates", storage.break_image_candidates);
      }
      if (root.contains("encoder")) {
        const auto& j = root["encoder"];
        overlay(j, "ffmpeg_path", encoder.ffmpeg_path);
        overlay(j, "ffprobe_path", encoder.ffprobe_path);
        overlay(j, "prober", encoder.prober);
        overlay(j, "encode_timeout", encoder.encode_timeout);
        overlay(j, "probe_timeout", encoder.probe_timeout);
        if (j.contains("target")) {
          const auto& t = j["target"];
          overlay(t, "width", encoder.target.width);
          overlay(t, "height", encoder.target.height);
          overlay(t, "fps", encoder.target.fps);
          overlay(t, "codec_lib", encoder.target.codec_lib);
          overlay(t, "codec", encoder.target.codec);
          overlay(t, "preset", encoder.target.preset);
          overlay(t, "crf", encoder.target.crf);
          overlay(t, "pix_fmt", encoder.target.pix_fmt);
        }
      }
      if (root.contains("streaming")) {
        const auto& j = root["streaming"];
        overlay(j, "direct_chunk_size", streaming.direct_chunk_size);
        overlay(j, "direct_read_timeout", streaming.direct_read_timeout);
        overlay(j, "direct_total_timeout", streaming.direct_total_timeout);
        overlay(j, "startup_buffer_size", streaming.startup_buffer_size);
        overlay(j, "startup_read_timeout", streaming.startup_read_timeout);
        overlay(j, "startup_total_timeout", streaming.startup_total_timeout);
        overlay(j, "relay_chunk_size", streaming.relay_chunk_size);
        overlay(j, "relay_read_timeout", streaming.relay_read_timeout);
      }
      if (root.contains("download")) {
        const auto& j = root["download"];
        overlay(j, "max_parallel", download.max_parallel);
        overlay(j, "timeout", download.timeout);
        overlay(j, "chunk_size", download.chunk_size);
        overlay(j, "auth_token", download.auth_token);
      }
      if (root.contains("breaks")) {
        overlay(root["breaks"], "common_durations", breaks.common_durations);
      }
      if (root.contains("workout")) {
        const auto& j = root["workout"];
        overlay(j, "work_time", workout.work_time);
        overlay(j, "rest_time", workout.rest_time);
        overlay(j, "speed_enabled", workout.speed_enabled);
        overlay(j, "speed_multipliers", workout.speed_multipliers);
        overlay(j, "seconds_per_exercise", workout.seconds_per_exercise);
        overlay(j, "count_from_intervals", workout.count_from_intervals);
        overlay(j, "max_total_duration", workout.max_total_duration);
      }
      if (root.contains("job_store")) {
        overlay(root["job_store"], "ttl", job_store.ttl);
      }
      overlay(root, "log_level", log_level);
    } catch (const json::exception& e) {
      return std::unexpected(std::string("Invalid config value: ") + e.what());
    }

    if (workout.work_time <= 0 || workout.rest_time <= 0) {
      return std::unexpected("work_time and rest_time must be positive");
    }
    if (workout.max_total_duration <= 0) {
      return std::unexpected("workout.max_total_duration must be positive");
    }
    if (streaming.direct_chunk_size == 0 || streaming.relay_chunk_size == 0) {
      return std::unexpected("streaming chunk sizes must be at least 1");
    }
    if (streaming.startup_buffer_size == 0) {
      return std::unexpected("streaming.startup_buffer_size must be at least 1");
    }
    if (download.max_parallel == 0) {
      return std::unexpected("download.max_parallel must be at least 1");
    }

    server_ = server;
    storage_ = storage;
    encoder_ = encoder;
    streaming_ = streaming;
    download_ = download;
    breaks_ = breaks;
    workout_ = workout;
    job_store_ = job_store;
    log_level_ = log_level;
    return {};
  }
}
