#pragma once
#include "common/config/config.hpp"
#include "domain/process_runner.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace workout_service {

// One line of a concat demuxer list. `outpoint` cuts the file at that many
// seconds without a separate trim pass.
struct ConcatEntry {
  std::string path;
  std::optional<double> outpoint;
};

// Typed builders for every encoder and prober invocation. Nothing here runs a
// process; the result goes to a ProcessRunner.
class FfmpegCommands {
public:
  explicit FfmpegCommands(config::EncoderConfig encoder);

  const config::TargetFormatConfig& target() const { return encoder_.target; }

  // First video stream only, JSON on stdout.
  CommandSpec probe(const std::string& path) const;
  // Still image looped for `duration` seconds at target size, codec and fps.
  CommandSpec breakClip(const std::string& image, int duration, const std::string& output) const;
  // At most `duration` seconds of `input`, re-encoded to the target profile.
  CommandSpec trim(const std::string& input, int duration, const std::string& output,
                   double speed_multiplier = 1.0) const;
  // Full re-encode to the target resolution, frame rate and codec.
  CommandSpec normalize(const std::string& input, const std::string& output) const;
  CommandSpec concatCopy(const std::string& list_file, const std::string& output) const;
  CommandSpec concatReencode(const std::string& list_file, const std::string& output) const;
  // One-shot concatenation to fragmented MP4 on stdout.
  CommandSpec streamConcat(const std::string& list_file, double speed_multiplier = 1.0) const;

  // Writes a concat demuxer list. Paths are made absolute and quoted.
  static std::expected<void, std::string> writeConcatList(const std::filesystem::path& list_file,
                                                          const std::vector<std::string>& files);
  static std::expected<void, std::string> writeConcatList(const std::filesystem::path& list_file,
                                                          const std::vector<ConcatEntry>& entries);

private:
  std::vector<std::string> ffmpegPrefix() const;
  std::vector<std::string> encodeArgs() const;
  std::string scaleFilter() const;

  config::EncoderConfig encoder_;
};

} // namespace workout_service
