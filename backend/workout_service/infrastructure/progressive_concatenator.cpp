#include "progressive_concatenator.hpp"
#include "encode_step.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace workout_service {

namespace {
std::string segmentLabel(size_t index, const std::string& path) {
  return "segment " + std::to_string(index) + " (" + fs::path(path).filename().string() + ")";
}
}

ProgressiveConcatenator::ProgressiveConcatenator(std::shared_ptr<ProcessRunner> runner,
                                                 std::shared_ptr<const FfmpegCommands> commands,
                                                 std::shared_ptr<FormatProber> prober,
                                                 std::chrono::seconds encode_timeout)
  : runner_(std::move(runner)),
    commands_(std::move(commands)),
    prober_(std::move(prober)),
    encode_timeout_(encode_timeout) {}

Result<void> ProgressiveConcatenator::normalize(const std::string& input, const fs::path& output,
                                                const std::string& step, AssemblyReport& report) {
  auto res = runEncodeStep(*runner_, commands_->normalize(input, output.string()), encode_timeout_,
                           "normalize " + step, output);
  if (res) {
    ++report.normalizations;
  }
  return res;
}

Result<void> ProgressiveConcatenator::copy(const std::string& input, const fs::path& output,
                                           const std::string& step) {
  std::error_code ec;
  fs::copy_file(input, output, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    return makeError(ErrorKind::Internal, "copy " + step + ": " + ec.message());
  }
  return {};
}

Result<AssemblyReport> ProgressiveConcatenator::build(const std::vector<std::string>& segments,
                                                      const fs::path& output_path,
                                                      const fs::path& work_dir,
                                                      ProgressCallback progress) {
  if (segments.empty()) {
    return makeError(ErrorKind::InvalidRequest, "nothing to concatenate");
  }
  auto start = std::chrono::steady_clock::now();
  const auto& target = commands_->target();

  AssemblyReport report;
  report.strategy = name();

  std::vector<std::optional<VideoFormatDescriptor>> formats;
  formats.reserve(segments.size());
  for (const auto& segment : segments) {
    formats.push_back(prober_->probe(segment));
  }
  report.homogeneous = std::all_of(formats.begin(), formats.end(), [&formats](const auto& f) {
    return f && formats.front() && equivalent(*f, *formats.front());
  });
  bool first_on_target = formats.front() && matchesTarget(*formats.front(), target);
  bool stream_copy = report.homogeneous && first_on_target;
  common::Logger::debug(std::string("concatenating ") + std::to_string(segments.size()) + " segments, " +
                        (stream_copy ? "stream copy" : "re-encode"));

  auto accumulatorPath = [&work_dir](size_t step) {
    return work_dir / ("accumulator_" + std::to_string(step) + ".mp4");
  };

  size_t live = 0;
  auto track = [&report, &live](long delta) {
    live = static_cast<size_t>(static_cast<long>(live) + delta);
    report.peak_accumulators = std::max(report.peak_accumulators, live);
  };

  fs::path accumulator = accumulatorPath(0);
  if (first_on_target && (stream_copy || segments.size() == 1)) {
    if (auto res = copy(segments[0], accumulator, segmentLabel(0, segments[0])); !res) {
      return std::unexpected(res.error());
    }
  } else if (auto res = normalize(segments[0], accumulator, segmentLabel(0, segments[0]), report); !res) {
    return std::unexpected(res.error());
  }
  track(+1);
  if (progress) progress(1);

  for (size_t i = 1; i < segments.size(); ++i) {
    auto label = segmentLabel(i, segments[i]);
    auto next = accumulatorPath(i);
    auto list = work_dir / ("concat_" + std::to_string(i) + ".txt");
    fs::path normalized;
    std::string merge_input = segments[i];

    if (!stream_copy) {
      normalized = work_dir / ("normalized_" + std::to_string(i) + ".mp4");
      if (auto res = normalize(segments[i], normalized, label, report); !res) {
        return std::unexpected(res.error());
      }
      merge_input = normalized.string();
    }

    if (auto res = FfmpegCommands::writeConcatList(list, std::vector<std::string>{accumulator.string(), merge_input}); !res) {
      return makeError(ErrorKind::Internal, "merge " + label + ": " + res.error());
    }

    auto cmd = stream_copy ? commands_->concatCopy(list.string(), next.string())
                           : commands_->concatReencode(list.string(), next.string());
    track(+1);
    auto merged = runEncodeStep(*runner_, cmd, encode_timeout_, "merge " + label, next);

    std::error_code ec;
    fs::remove(list, ec);
    if (!normalized.empty()) {
      fs::remove(normalized, ec);
    }
    if (!merged) {
      return std::unexpected(merged.error());
    }
    if (stream_copy) {
      ++report.stream_copy_merges;
    } else {
      ++report.reencode_merges;
    }

    fs::remove(accumulator, ec);
    track(-1);
    accumulator = next;
    if (progress) progress(i + 1);
  }

  if (auto res = moveFile(accumulator, output_path); !res) {
    return std::unexpected(res.error());
  }

  std::ostringstream oss;
  oss << "concatenated " << segments.size() << " segments in "
      << std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count() << "s ("
      << report.stream_copy_merges << " copy, " << report.reencode_merges << " re-encode merges)";
  common::Logger::info(oss.str());
  return report;
}

} // namespace workout_service
