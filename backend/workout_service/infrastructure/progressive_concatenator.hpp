#pragma once
#include "domain/format_prober.hpp"
#include "domain/process_runner.hpp"
#include "domain/video_assembler.hpp"
#include "ffmpeg_commands.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace workout_service {

// Builds the output through one growing accumulator file. Each step merges
// the next segment into a new accumulator and deletes the previous one, so no
// more than two accumulators exist at any time. Homogeneous inputs already in
// the target format are merged by stream copy, everything else is normalized
// and re-encoded.
class ProgressiveConcatenator : public VideoAssembler {
public:
  ProgressiveConcatenator(std::shared_ptr<ProcessRunner> runner,
                          std::shared_ptr<const FfmpegCommands> commands,
                          std::shared_ptr<FormatProber> prober,
                          std::chrono::seconds encode_timeout);

  std::string name() const override { return "progressive"; }
  Result<AssemblyReport> build(const std::vector<std::string>& segments,
                               const std::filesystem::path& output_path,
                               const std::filesystem::path& work_dir,
                               ProgressCallback progress = nullptr) override;

private:
  Result<void> normalize(const std::string& input, const std::filesystem::path& output,
                         const std::string& step, AssemblyReport& report);
  Result<void> copy(const std::string& input, const std::filesystem::path& output, const std::string& step);

  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<const FfmpegCommands> commands_;
  std::shared_ptr<FormatProber> prober_;
  std::chrono::seconds encode_timeout_;
};

} // namespace workout_service
