#include "sequential_assembler.hpp"
#include "encode_step.hpp"
#include "common/logger.hpp"

namespace fs = std::filesystem;

namespace workout_service {

SequentialAssembler::SequentialAssembler(std::shared_ptr<ProcessRunner> runner,
                                         std::shared_ptr<const FfmpegCommands> commands,
                                         std::shared_ptr<FormatProber> prober,
                                         std::chrono::seconds encode_timeout)
  : runner_(std::move(runner)),
    commands_(std::move(commands)),
    prober_(std::move(prober)),
    encode_timeout_(encode_timeout) {}

Result<AssemblyReport> SequentialAssembler::build(const std::vector<std::string>& segments,
                                                  const fs::path& output_path,
                                                  const fs::path& work_dir,
                                                  ProgressCallback progress) {
  if (segments.empty()) {
    return makeError(ErrorKind::InvalidRequest, "nothing to concatenate");
  }

  AssemblyReport report;
  report.strategy = name();

  auto reference = prober_->probe(segments.front());
  report.homogeneous = reference.has_value();
  for (size_t i = 1; i < segments.size() && report.homogeneous; ++i) {
    auto desc = prober_->probe(segments[i]);
    report.homogeneous = desc && equivalent(*desc, *reference);
  }
  bool stream_copy = report.homogeneous && matchesTarget(*reference, commands_->target());

  auto list = work_dir / "concat_all.txt";
  if (auto res = FfmpegCommands::writeConcatList(list, segments); !res) {
    return makeError(ErrorKind::Internal, res.error());
  }

  auto merged = work_dir / "sequential_output.mp4";
  auto cmd = stream_copy ? commands_->concatCopy(list.string(), merged.string())
                         : commands_->concatReencode(list.string(), merged.string());
  auto res = runEncodeStep(*runner_, cmd, encode_timeout_,
                           "concatenate " + std::to_string(segments.size()) + " segments", merged);
  std::error_code ec;
  fs::remove(list, ec);
  if (!res) {
    return std::unexpected(res.error());
  }
  if (stream_copy) {
    report.stream_copy_merges = 1;
  } else {
    report.reencode_merges = 1;
  }
  report.peak_accumulators = 1;

  if (auto moved = moveFile(merged, output_path); !moved) {
    return std::unexpected(moved.error());
  }
  if (progress) progress(segments.size());
  common::Logger::info("sequential concat of " + std::to_string(segments.size()) + " segments done (" +
                       (stream_copy ? "stream copy" : "re-encode") + ")");
  return report;
}

} // namespace workout_service
