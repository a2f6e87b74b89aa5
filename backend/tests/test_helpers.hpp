#pragma once
#include "domain/download_service.hpp"
#include "domain/format_prober.hpp"
#include "domain/process_runner.hpp"
#include "application/workout_service.hpp"
#include "infrastructure/memory_job_store.hpp"
#include "infrastructure/subprocess_runner.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace workout_test {

using namespace workout_service;

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir();
  ~TempDir();
  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

void writeFile(const std::filesystem::path& path, const std::string& content);
std::string readFile(const std::filesystem::path& path);
size_t countFiles(const std::filesystem::path& dir, const std::string& prefix = "");

// Stands in for ffmpeg/ffprobe. Output files get deterministic content:
// concat writes its inputs back to back, trim and normalize copy their input,
// a break clip contains "[break:<seconds>]".
class FakeRunner : public ProcessRunner {
public:
  std::expected<ProcessResult, std::string> run(const CommandSpec& command,
                                                std::chrono::milliseconds timeout) override;
  // Records the command and runs `start_script` through /bin/sh instead.
  std::expected<std::unique_ptr<RunningProcess>, std::string> start(const CommandSpec& command) override;

  static std::string kindOf(const CommandSpec& command);
  size_t count(const std::string& kind) const;
  std::vector<CommandSpec> commands() const;

  // Returning true makes the command exit with code 1 and stderr "boom".
  std::function<bool(const CommandSpec&)> fail_when;
  // Called before each run.
  std::function<void(const CommandSpec&)> on_run;
  // stdout of probe commands, by probed path.
  std::map<std::string, std::string> probe_output;
  std::string start_script = "printf 'stream-bytes'";

private:
  mutable std::mutex mtx_;
  std::vector<CommandSpec> commands_;
  SubprocessRunner real_;
};

class FakeProber : public FormatProber {
public:
  std::optional<VideoFormatDescriptor> probe(const std::string& path) override;

  std::map<std::string, std::optional<VideoFormatDescriptor>> formats;
  std::optional<VideoFormatDescriptor> fallback;
  std::atomic<int> calls{0};
};

class FakeDownloader : public DownloadService {
public:
  std::expected<uint64_t, std::string> download(const std::string& url, const std::string& output_path,
                                                const std::string& auth_token,
                                                ProgressCallback progress_callback = nullptr) override;

  std::atomic<int> calls{0};
  bool fail{false};
  std::string content = "remote-video";
};

VideoFormatDescriptor targetFormat();
VideoFormatDescriptor otherFormat();

config::StreamingConfig smallStreamBuffers();

// A WorkoutService wired to the fakes above. The catalog holds "Squat" and
// "Plank" as local files and "Jump Lunge" as a remote URL; the planner draws
// one exercise per minute with a fixed seed; 20s is the only cached break.
struct ServiceHarness {
  explicit ServiceHarness(config::WorkoutDefaults defaults = testDefaults());

  static config::WorkoutDefaults testDefaults();
  std::filesystem::path tempRoot() const { return dir / "tmp"; }
  bool tempRootEmpty() const;

  TempDir dir;
  std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
  std::shared_ptr<FakeProber> prober = std::make_shared<FakeProber>();
  std::shared_ptr<FakeDownloader> downloader = std::make_shared<FakeDownloader>();
  std::shared_ptr<MemoryJobStore> store = std::make_shared<MemoryJobStore>();
  config::WorkoutDefaults defaults;
  std::shared_ptr<WorkoutService> service;
};

} // namespace workout_test
