#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <vector>

namespace config {

struct ServerConfig {
  std::string host;
  unsigned short port;
  int io_threads;
  size_t stream_workers;
};

struct StorageConfig {
  std::string project_root;
  std::string local_assets_dir;
  std::string cache_dir;
  std::string break_cache_dir;
  std::string temp_root;
  std::string catalog_path;
  std::vector<std::string> break_image_candidates;
};

// Output profile every segment has to reach before stream copy is legal.
struct TargetFormatConfig {
  int width;
  int height;
  int fps;
  std::string codec_lib;
  std::string codec;
  std::string preset;
  int crf;
  std::string pix_fmt;
};

struct EncoderConfig {
  std::string ffmpeg_path;
  std::string ffprobe_path;
  std::string prober;  // "ffprobe" or "libav"
  TargetFormatConfig target;
  std::chrono::seconds encode_timeout;
  std::chrono::seconds probe_timeout;
};

struct StreamingConfig {
  size_t direct_chunk_size;
  std::chrono::seconds direct_read_timeout;
  std::chrono::seconds direct_total_timeout;
  size_t startup_buffer_size;
  std::chrono::seconds startup_read_timeout;
  std::chrono::seconds startup_total_timeout;
  size_t relay_chunk_size;
  std::chrono::seconds relay_read_timeout;
};

struct DownloadConfig {
  size_t max_parallel;
  std::chrono::seconds timeout;
  size_t chunk_size;
  std::string auth_token;
};

struct BreakConfig {
  std::vector<int> common_durations;
};

struct WorkoutDefaults {
  int work_time;
  int rest_time;
  bool speed_enabled;
  std::map<std::string, double> speed_multipliers;  // intensity -> multiplier
  int seconds_per_exercise;
  bool count_from_intervals;
  int max_total_duration;  // seconds
};

struct JobStoreConfig {
  std::chrono::seconds ttl;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overlays the JSON document at `path` onto the current values.
std::expected<void, std::string> loadFromFile(const std::string& path);
std::expected<void, std::string> loadFromString(const std::string& json_text);

// Getters
const ServerConfig& getServer() const { return server_; }
const StorageConfig& getStorage() const { return storage_; }
const EncoderConfig& getEncoder() const { return encoder_; }
const StreamingConfig& getStreaming() const { return streaming_; }
const DownloadConfig& getDownload() const { return download_; }
const BreakConfig& getBreaks() const { return breaks_; }
const WorkoutDefaults& getWorkout() const { return workout_; }
const JobStoreConfig& getJobStore() const { return job_store_; }
const std::string& getLogLevel() const { return log_level_; }
std::string getServerIpPort() const { return server_.host+":"+std::to_string(server_.port);}

private:
  Config();

  ServerConfig server_;
  StorageConfig storage_;
  EncoderConfig encoder_;
  StreamingConfig streaming_;
  DownloadConfig download_;
  BreakConfig breaks_;
  WorkoutDefaults workout_;
  JobStoreConfig job_store_;
  std::string log_level_;
};

} // namespace config
