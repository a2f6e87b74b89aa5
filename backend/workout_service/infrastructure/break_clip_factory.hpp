#pragma once

// project
#include "domain/errors.hpp"
#include "domain/format_prober.hpp"
#include "domain/process_runner.hpp"
#include "ffmpeg_commands.hpp"

// std
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace workout_service {

// Produces still-image filler clips. Common durations live in a cache that
// outlives jobs; any other duration is rendered into the caller's directory.
class BreakClipFactory {
public:
  struct Options {
    std::filesystem::path cache_dir;
    std::vector<std::string> image_candidates;
    std::vector<int> common_durations;
    std::chrono::seconds encode_timeout{600};
  };

  struct CacheStats {
    size_t files{0};
    uintmax_t bytes{0};
    std::vector<int> durations;
  };

  BreakClipFactory(std::shared_ptr<ProcessRunner> runner,
                   std::shared_ptr<const FfmpegCommands> commands,
                   std::shared_ptr<FormatProber> prober,
                   Options options);

  // Renders every common duration that is missing or does not have the target
  // resolution. Returns how many common clips are ready afterwards.
  size_t warmUp();

  Result<std::string> getBreak(int duration, const std::filesystem::path& scratch_dir);

  std::optional<std::string> backgroundImage() const;
  bool isCommon(int duration) const;
  CacheStats stats() const;

  static std::string fileName(int duration);

private:
  Result<std::string> generate(int duration, const std::filesystem::path& output);
  std::shared_ptr<std::mutex> lockFor(int duration);

  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<const FfmpegCommands> commands_;
  std::shared_ptr<FormatProber> prober_;
  Options options_;

  std::mutex locks_mtx_;
  std::map<int, std::shared_ptr<std::mutex>> locks_;
};

} // namespace workout_service
