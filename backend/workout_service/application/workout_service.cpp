#include "workout_service.hpp"
#include "common/ids.hpp"
#include "common/logger.hpp"
#include <sstream>

namespace fs = std::filesystem;

namespace workout_service {

namespace {
double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}
}

WorkoutService::WorkoutService(std::shared_ptr<ExerciseCatalog> catalog,
                               std::shared_ptr<WorkoutPlanner> planner,
                               std::shared_ptr<JobStore> store,
                               std::shared_ptr<AssetResolver> resolver,
                               std::shared_ptr<BreakClipFactory> breaks,
                               std::shared_ptr<SegmentPreparer> preparer,
                               std::vector<std::shared_ptr<VideoAssembler>> assemblers,
                               std::shared_ptr<StreamPipeline> pipeline,
                               std::shared_ptr<const FfmpegCommands> commands,
                               Options options)
  : catalog_(std::move(catalog)),
    planner_(std::move(planner)),
    store_(std::move(store)),
    resolver_(std::move(resolver)),
    breaks_(std::move(breaks)),
    preparer_(std::move(preparer)),
    assemblers_(std::move(assemblers)),
    pipeline_(std::move(pipeline)),
    commands_(std::move(commands)),
    options_(std::move(options)) {
  fs::create_directories(options_.temp_root);
}

std::vector<ExerciseRecord> WorkoutService::listExercises() const {
  return catalog_->list();
}

Result<ExerciseRecord> WorkoutService::getExercise(const std::string& id_or_name) const {
  return catalog_->get(id_or_name);
}

double WorkoutService::speedMultiplier(Intensity intensity) const {
  if (!options_.defaults.speed_enabled) {
    return 1.0;
  }
  const auto& table = options_.defaults.speed_multipliers;
  auto it = table.find(toString(intensity));
  if (it == table.end()) {
    return 1.0;
  }
  return it->second;
}

Result<WorkoutSpec> WorkoutService::buildSpec(std::vector<ExerciseRecord> exercises,
                                              const WorkoutConfig& config) const {
  WorkoutSpec spec{std::move(exercises), speedMultiplier(config.intensity), config.work_time, config.rest_time};
  if (spec.exercises.empty()) {
    return makeError(ErrorKind::InvalidRequest, "no exercises selected");
  }
  if (!spec.valid()) {
    return makeError(ErrorKind::InvalidRequest, "work and rest times must be positive");
  }
  return spec;
}

Result<std::vector<ExerciseRecord>> WorkoutService::plan(const WorkoutConfig& config, int total_duration) {
  if (total_duration <= 0) {
    return makeError(ErrorKind::InvalidRequest, "total_duration must be positive");
  }
  return planner_->plan(catalog_->list(), PlanConstraints{config, total_duration});
}

Result<StreamStats> WorkoutService::streamExercises(const std::vector<std::string>& names,
                                                    const WorkoutConfig& config,
                                                    const StreamPipeline::ChunkSink& sink,
                                                    const std::atomic_bool* cancelled) {
  std::vector<ExerciseRecord> selected;
  for (const auto& name : names) {
    auto exercise = catalog_->get(name);
    if (!exercise) {
      common::Logger::error("exercise not found: " + name);
      return std::unexpected(exercise.error());
    }
    selected.push_back(exercise.value());
  }
  auto spec = buildSpec(std::move(selected), config);
  if (!spec) {
    return std::unexpected(spec.error());
  }

  auto assets = resolver_->resolveAll(spec->exercises);
  if (!assets) {
    return std::unexpected(assets.error());
  }

  auto job = GenerationJob::create(options_.temp_root);
  if (!job) {
    return std::unexpected(job.error());
  }
  (*job)->setAssets(assets.value());

  std::vector<std::string> files;
  for (const auto& asset : assets.value()) {
    files.push_back(asset.local_path);
  }
  auto list = (*job)->tempPath("concat.txt");
  if (auto res = FfmpegCommands::writeConcatList(list, files); !res) {
    return makeError(ErrorKind::Internal, res.error());
  }

  common::Logger::info("direct stream of " + std::to_string(files.size()) + " exercises, speed " +
                       std::to_string(spec->speed_multiplier));
  return pipeline_->streamDirect(commands_->streamConcat(list.string(), spec->speed_multiplier), sink, cancelled);
}

Result<StagedWorkout> WorkoutService::prepareWorkout(const WorkoutConfig& config, int total_duration,
                                                     const std::string& name,
                                                     std::optional<std::string> workout_id) {
  auto start = std::chrono::steady_clock::now();
  auto exercises = plan(config, total_duration);
  if (!exercises) {
    return std::unexpected(exercises.error());
  }
  auto spec = buildSpec(std::move(exercises.value()), config);
  if (!spec) {
    return std::unexpected(spec.error());
  }
  auto assets = resolver_->resolveAll(spec->exercises);
  if (!assets) {
    return std::unexpected(assets.error());
  }

  StoredWorkout stored;
  stored.id = workout_id && !workout_id->empty() ? *workout_id : common::newUuid();
  stored.name = name;
  stored.spec = std::move(spec.value());
  stored.assets = std::move(assets.value());
  stored.created_at = std::chrono::system_clock::now();
  store_->put(stored, options_.job_ttl);

  std::ostringstream oss;
  oss << "staged workout " << stored.id << " with " << stored.spec.exercises.size() << " exercises in "
      << secondsSince(start) << "s";
  common::Logger::info(oss.str());
  return StagedWorkout{stored.id, stored.spec.exercises.size(), "/api/stream-workout/" + stored.id};
}

Result<StreamStats> WorkoutService::streamWorkout(const std::string& workout_id,
                                                  const StreamPipeline::ChunkSink& sink,
                                                  const std::atomic_bool* cancelled) {
  auto stored = store_->get(workout_id);
  if (!stored) {
    return makeError(ErrorKind::JobNotFound, "Workout '" + workout_id + "' not found");
  }
  const auto& spec = stored->spec;
  if (stored->assets.size() != spec.exercises.size() || stored->assets.empty()) {
    return makeError(ErrorKind::Internal, "workout '" + workout_id + "' has no resolved assets");
  }

  auto job = GenerationJob::create(options_.temp_root, workout_id);
  if (!job) {
    return std::unexpected(job.error());
  }

  std::vector<ConcatEntry> entries;
  for (size_t i = 0; i < stored->assets.size(); ++i) {
    entries.push_back({stored->assets[i].local_path, static_cast<double>(spec.work_time)});
    if (i + 1 < stored->assets.size()) {
      auto rest = breaks_->getBreak(spec.rest_time, (*job)->workDir());
      if (!rest) {
        return std::unexpected(rest.error());
      }
      entries.push_back({rest.value(), std::nullopt});
    }
  }
  auto list = (*job)->tempPath("concat.txt");
  if (auto res = FfmpegCommands::writeConcatList(list, entries); !res) {
    return makeError(ErrorKind::Internal, res.error());
  }

  common::Logger::info("streaming workout " + workout_id + " (" + std::to_string(entries.size()) + " segments)");
  return pipeline_->streamBuffered(commands_->streamConcat(list.string(), spec.speed_multiplier), sink, cancelled);
}

Result<AssemblyReport> WorkoutService::assemble(const std::vector<Segment>& segments, GenerationJob& job) {
  std::vector<std::string> paths;
  paths.reserve(segments.size());
  for (const auto& s : segments) {
    paths.push_back(s.path);
  }

  std::optional<GenerationError> last_error;
  for (size_t i = 0; i < assemblers_.size(); ++i) {
    auto& assembler = assemblers_[i];
    auto attempt_dir = job.workDir() / ("assembly_" + assembler->name());
    std::error_code ec;
    fs::create_directories(attempt_dir, ec);
    if (ec) {
      return makeError(ErrorKind::Internal, "cannot create " + attempt_dir.string());
    }

    auto report = assembler->build(paths, job.outputPath(), attempt_dir,
                                   [&job](size_t merged) { job.advanceMerged(merged); });
    fs::remove_all(attempt_dir, ec);
    if (report) {
      return report;
    }
    common::Logger::warn(assembler->name() + " assembly failed: " + report.error().describe() +
                         (i + 1 < assemblers_.size() ? ", falling back" : ""));
    last_error = report.error();
  }
  if (!last_error) {
    return makeError(ErrorKind::Internal, "no video assembler configured");
  }
  return std::unexpected(*last_error);
}

Result<GeneratedWorkout> WorkoutService::generateWorkoutVideo(const WorkoutConfig& config, int total_duration,
                                                              const std::string& name) {
  auto start = std::chrono::steady_clock::now();
  auto exercises = plan(config, total_duration);
  if (!exercises) {
    return std::unexpected(exercises.error());
  }
  auto spec = buildSpec(std::move(exercises.value()), config);
  if (!spec) {
    return std::unexpected(spec.error());
  }

  auto job = GenerationJob::create(options_.temp_root);
  if (!job) {
    return std::unexpected(job.error());
  }
  auto& current = **job;

  auto assets = resolver_->resolveAll(spec->exercises);
  if (!assets) {
    return std::unexpected(assets.error());
  }
  current.setAssets(assets.value());

  auto break_start = std::chrono::steady_clock::now();
  std::optional<std::string> rest_clip;
  if (spec->exercises.size() > 1) {
    auto clip = breaks_->getBreak(spec->rest_time, current.workDir());
    if (!clip) {
      return std::unexpected(clip.error());
    }
    rest_clip = clip.value();
  }
  std::ostringstream breaks_log;
  breaks_log << "break clip ready in " << secondsSince(break_start) << "s";
  common::Logger::info(breaks_log.str());

  std::vector<Segment> segments;
  for (size_t i = 0; i < current.assets().size(); ++i) {
    segments.push_back(preparer_->prepare(current.assets()[i], spec->exercises[i].name, spec->work_time,
                                          current.workDir(), i, spec->speed_multiplier));
    if (rest_clip && i + 1 < current.assets().size()) {
      segments.push_back(Segment{SegmentKind::Break, *rest_clip, "break", spec->rest_time, false});
    }
  }

  current.setOutputPath(current.tempPath("workout_" + current.id() + ".mp4"));
  auto report = assemble(segments, current);
  if (!report) {
    common::Logger::error("workout generation failed: " + report.error().describe());
    return std::unexpected(report.error());
  }

  std::ostringstream oss;
  oss << "generated workout '" << name << "' " << current.id() << " (" << segments.size() << " segments, " << report->strategy
      << ") in " << secondsSince(start) << "s";
  common::Logger::info(oss.str());

  GeneratedWorkout generated;
  generated.workout_id = current.id();
  generated.exercise_count = spec->exercises.size();
  generated.output_path = current.outputPath();
  generated.report = report.value();
  generated.job = std::move(job.value());
  return generated;
}

CacheReport WorkoutService::cacheStats() const {
  return CacheReport{resolver_->stats(), breaks_->stats()};
}

} // namespace workout_service
