#pragma once
#include "domain/format_prober.hpp"
#include "domain/process_runner.hpp"
#include "ffmpeg_commands.hpp"
#include <chrono>
#include <memory>

namespace workout_service {

class FfprobeProber : public FormatProber {
public:
  FfprobeProber(std::shared_ptr<ProcessRunner> runner,
                std::shared_ptr<const FfmpegCommands> commands,
                std::chrono::seconds timeout);

  std::optional<VideoFormatDescriptor> probe(const std::string& path) override;

  // Reads the first entry of "streams" from ffprobe's JSON output.
  static std::optional<VideoFormatDescriptor> parseProbeOutput(const std::string& json_text);
  // "30000/1001" -> 29.97; a zero denominator yields 30.
  static double parseFrameRate(const std::string& rate);

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<const FfmpegCommands> commands_;
  std::chrono::seconds timeout_;
};

} // namespace workout_service
