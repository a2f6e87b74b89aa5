#pragma once
#include "domain/format_prober.hpp"
#include "domain/process_runner.hpp"
#include "domain/video_assembler.hpp"
#include "ffmpeg_commands.hpp"
#include <chrono>
#include <memory>

namespace workout_service {

// One concat-demuxer pass over every segment: stream copy when all segments
// share the target format, a single full re-encode otherwise.
class SequentialAssembler : public VideoAssembler {
public:
  SequentialAssembler(std::shared_ptr<ProcessRunner> runner,
                      std::shared_ptr<const FfmpegCommands> commands,
                      std::shared_ptr<FormatProber> prober,
                      std::chrono::seconds encode_timeout);

  std::string name() const override { return "sequential"; }
  Result<AssemblyReport> build(const std::vector<std::string>& segments,
                               const std::filesystem::path& output_path,
                               const std::filesystem::path& work_dir,
                               ProgressCallback progress = nullptr) override;

private:
  std::shared_ptr<ProcessRunner> runner_;
  std::shared_ptr<const FfmpegCommands> commands_;
  std::shared_ptr<FormatProber> prober_;
  std::chrono::seconds encode_timeout_;
};

} // namespace workout_service
