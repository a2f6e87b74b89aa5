#include "test_helpers.hpp"
#include "common/ids.hpp"
#include "infrastructure/json_exercise_catalog.hpp"
#include "infrastructure/progressive_concatenator.hpp"
#include "infrastructure/random_workout_planner.hpp"
#include "infrastructure/sequential_assembler.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace workout_test {

TempDir::TempDir() : path_(fs::temp_directory_path() / ("workout_test_" + common::newUuid())) {
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

void writeFile(const fs::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string readFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

size_t countFiles(const fs::path& dir, const std::string& prefix) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  size_t n = 0;
  for (const auto& entry : fs::recursive_directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().filename().string().starts_with(prefix)) ++n;
  }
  return n;
}

namespace {
std::string argAfter(const std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || it + 1 == args.end()) return {};
  return *(it + 1);
}

bool hasArg(const std::vector<std::string>& args, const std::string& value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

std::vector<std::string> readConcatList(const fs::path& list) {
  std::vector<std::string> files;
  std::istringstream in(readFile(list));
  std::string line;
  while (std::getline(in, line)) {
    if (!line.starts_with("file '")) continue;
    auto quoted = line.substr(6, line.size() - 7);
    std::string path;
    for (size_t i = 0; i < quoted.size(); ++i) {
      if (quoted.compare(i, 4, "'\\''") == 0) {
        path += '\'';
        i += 3;
      } else {
        path += quoted[i];
      }
    }
    files.push_back(path);
  }
  return files;
}
}

std::string FakeRunner::kindOf(const CommandSpec& command) {
  const auto& args = command.args;
  if (!args.empty() && args[0].find("ffprobe") != std::string::npos) return "probe";
  if (hasArg(args, "concat")) return hasArg(args, "copy") ? "concat_copy" : "concat_reencode";
  if (hasArg(args, "-loop")) return "break";
  if (hasArg(args, "-t")) return "trim";
  return "normalize";
}

size_t FakeRunner::count(const std::string& kind) const {
  std::lock_guard<std::mutex> lock{mtx_};
  return static_cast<size_t>(std::count_if(commands_.begin(), commands_.end(),
                                           [&kind](const CommandSpec& c) { return kindOf(c) == kind; }));
}

std::vector<CommandSpec> FakeRunner::commands() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return commands_;
}

std::expected<ProcessResult, std::string> FakeRunner::run(const CommandSpec& command,
                                                          std::chrono::milliseconds /*timeout*/) {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    commands_.push_back(command);
  }
  if (on_run) on_run(command);

  ProcessResult result;
  if (fail_when && fail_when(command)) {
    result.exit_code = 1;
    result.stderr_data = "boom";
    return result;
  }

  result.exit_code = 0;
  const auto& args = command.args;
  auto kind = kindOf(command);
  if (kind == "probe") {
    auto it = probe_output.find(args.back());
    if (it == probe_output.end()) {
      result.exit_code = 1;
    } else {
      result.stdout_data = it->second;
    }
    return result;
  }

  const auto& output = args.back();
  if (kind == "concat_copy" || kind == "concat_reencode") {
    std::string merged;
    for (const auto& file : readConcatList(argAfter(args, "-i"))) {
      merged += readFile(file);
    }
    writeFile(output, merged);
  } else if (kind == "break") {
    writeFile(output, "[break:" + argAfter(args, "-t") + "]");
  } else {
    writeFile(output, readFile(argAfter(args, "-i")));
  }
  return result;
}

std::expected<std::unique_ptr<RunningProcess>, std::string> FakeRunner::start(const CommandSpec& command) {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    commands_.push_back(command);
  }
  return real_.start(CommandSpec{{"/bin/sh", "-c", start_script}, OutputMode::Pipe});
}

std::optional<VideoFormatDescriptor> FakeProber::probe(const std::string& path) {
  ++calls;
  auto it = formats.find(path);
  if (it != formats.end()) return it->second;
  return fallback;
}

std::expected<uint64_t, std::string> FakeDownloader::download(const std::string& /*url*/,
                                                              const std::string& output_path,
                                                              const std::string& /*auth_token*/,
                                                              ProgressCallback /*progress_callback*/) {
  ++calls;
  if (fail) {
    return std::unexpected("HTTP error: 404");
  }
  writeFile(output_path, content);
  return content.size();
}

VideoFormatDescriptor targetFormat() {
  return VideoFormatDescriptor{"h264", 1280, 720, 30.0, 0, 0.0};
}

VideoFormatDescriptor otherFormat() {
  return VideoFormatDescriptor{"hevc", 1920, 1080, 25.0, 0, 0.0};
}

config::StreamingConfig smallStreamBuffers() {
  using std::chrono::seconds;
  return config::StreamingConfig{
    .direct_chunk_size = 256,
    .direct_read_timeout = seconds(2),
    .direct_total_timeout = seconds(10),
    .startup_buffer_size = 1000,
    .startup_read_timeout = seconds(2),
    .startup_total_timeout = seconds(10),
    .relay_chunk_size = 100,
    .relay_read_timeout = seconds(2),
  };
}

config::WorkoutDefaults ServiceHarness::testDefaults() {
  auto defaults = config::Config::getInstance().getWorkout();
  defaults.work_time = 40;
  defaults.rest_time = 20;
  defaults.speed_enabled = false;
  defaults.seconds_per_exercise = 60;
  defaults.count_from_intervals = false;
  defaults.max_total_duration = 3600;
  return defaults;
}

ServiceHarness::ServiceHarness(config::WorkoutDefaults workout_defaults) : defaults(std::move(workout_defaults)) {
  fs::create_directories(dir / "videos");
  writeFile(dir / "videos" / "squat.mov", "<squat>");
  writeFile(dir / "videos" / "plank.mov", "<plank>");
  writeFile(dir / "sport_room.png", "png");
  downloader->content = "<jump-lunge>";
  prober->fallback = targetFormat();

  auto catalog = JsonExerciseCatalog::fromJson(nlohmann::json::array({
    {{"id", "ex-squat"}, {"name", "Squat"}, {"video_url", "videos/squat.mov"}, {"difficulty", "easy"}},
    {{"id", "ex-plank"}, {"name", "Plank"}, {"video_url", "videos/plank.mov"}, {"difficulty", "medium"}},
    {{"id", "ex-lunge"}, {"name", "Jump Lunge"}, {"video_url", "https://cdn.example.com/jump_lunge.mp4"},
     {"difficulty", "hard"}, {"has_jump", true}},
  }));

  auto commands = std::make_shared<const FfmpegCommands>(config::Config::getInstance().getEncoder());
  auto timeout = std::chrono::seconds(30);
  auto resolver = std::make_shared<AssetResolver>(
    downloader, AssetResolver::Options{dir.path(), dir / "videos", dir / "cache", "", 2});
  auto breaks = std::make_shared<BreakClipFactory>(
    runner, commands, prober,
    BreakClipFactory::Options{dir / "breaks", {(dir / "sport_room.png").string()}, {20}, timeout});
  std::vector<std::shared_ptr<VideoAssembler>> assemblers{
    std::make_shared<ProgressiveConcatenator>(runner, commands, prober, timeout),
    std::make_shared<SequentialAssembler>(runner, commands, prober, timeout),
  };

  service = std::make_shared<WorkoutService>(
    std::make_shared<JsonExerciseCatalog>(std::move(catalog.value())),
    std::make_shared<RandomWorkoutPlanner>(defaults.seconds_per_exercise, defaults.count_from_intervals, 7u),
    store, resolver, breaks, std::make_shared<SegmentPreparer>(runner, commands, timeout),
    std::move(assemblers), std::make_shared<StreamPipeline>(runner, smallStreamBuffers()), commands,
    WorkoutService::Options{tempRoot(), std::chrono::seconds(3600), defaults});
}

bool ServiceHarness::tempRootEmpty() const {
  std::error_code ec;
  return fs::is_empty(tempRoot(), ec) && !ec;
}

} // namespace workout_test
