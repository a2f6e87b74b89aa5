#include "segment_preparer.hpp"
#include "common/logger.hpp"

namespace fs = std::filesystem;

namespace workout_service {

SegmentPreparer::SegmentPreparer(std::shared_ptr<ProcessRunner> runner,
                                 std::shared_ptr<const FfmpegCommands> commands,
                                 std::chrono::seconds encode_timeout)
  : runner_(std::move(runner)), commands_(std::move(commands)), encode_timeout_(encode_timeout) {}

Result<std::string> SegmentPreparer::trim(const std::string& source, int duration, const std::string& output,
                                          double speed_multiplier) {
  if (duration <= 0) {
    return makeError(ErrorKind::InvalidRequest, "trim duration must be positive");
  }
  auto result = runner_->run(commands_->trim(source, duration, output, speed_multiplier), encode_timeout_);
  if (!result) {
    return makeError(ErrorKind::EncodeFailed, "trim of " + source + ": " + result.error());
  }
  std::error_code ec;
  if (!result->ok() || !fs::exists(output, ec)) {
    fs::remove(output, ec);
    return makeError(ErrorKind::EncodeFailed,
                     "trim of " + source + (result->timed_out ? " timed out" : " failed"),
                     excerpt(result->stderr_data));
  }
  return output;
}

Segment SegmentPreparer::prepare(const ResolvedAsset& asset, const std::string& label, int duration,
                                 const fs::path& work_dir, size_t index, double speed_multiplier) {
  Segment segment{SegmentKind::Exercise, asset.local_path, label, duration, false};
  auto output = work_dir / ("trimmed_" + std::to_string(index) + ".mp4");
  auto res = trim(asset.local_path, duration, output.string(), speed_multiplier);
  if (res) {
    segment.path = res.value();
  } else {
    segment.degraded = true;
    common::Logger::warn("using untrimmed video for " + label + ": " + res.error().describe());
  }
  return segment;
}

} // namespace workout_service
