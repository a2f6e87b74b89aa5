#pragma once
#include "domain/errors.hpp"
#include "domain/process_runner.hpp"
#include "domain/video.hpp"
#include "ffmpeg_commands.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace workout_service {

class SegmentPreparer {
public:
  SegmentPreparer(std::shared_ptr<ProcessRunner> runner,
                  std::shared_ptr<const FfmpegCommands> commands,
                  std::chrono::seconds encode_timeout);

  // Re-encodes at most `duration` seconds of `source` into `output`.
  Result<std::string> trim(const std::string& source, int duration, const std::string& output,
                           double speed_multiplier = 1.0);

  // Trims the asset into `work_dir`. When trimming fails the untrimmed source
  // is returned with `degraded` set.
  Segment prepare(const ResolvedAsset& asset, const std::string& label, int duration,
                  const std::filesystem::path& work_dir, size_t index, double speed_multiplier = 1.0);

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<const FfmpegCommands> commands_;
  std::chrono::seconds encode_timeout_;
};

} // namespace workout_service
