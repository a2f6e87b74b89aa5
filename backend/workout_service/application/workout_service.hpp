#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/config/config.hpp"
#include "domain/exercise_catalog.hpp"
#include "domain/job_store.hpp"
#include "domain/video_assembler.hpp"
#include "domain/workout_planner.hpp"
#include "infrastructure/asset_resolver.hpp"
#include "infrastructure/break_clip_factory.hpp"
#include "infrastructure/ffmpeg_commands.hpp"
#include "infrastructure/segment_preparer.hpp"
#include "infrastructure/stream_pipeline.hpp"
#include "generation_job.hpp"

namespace workout_service {

struct StagedWorkout {
  std::string workout_id;
  size_t total_exercises{0};
  std::string stream_url;
};

// A finished workout file. The file lives in the job directory and goes away
// with `job`.
struct GeneratedWorkout {
  std::unique_ptr<GenerationJob> job;
  std::string workout_id;
  size_t exercise_count{0};
  std::filesystem::path output_path;
  AssemblyReport report;
};

struct CacheReport {
  AssetResolver::CacheStats assets;
  BreakClipFactory::CacheStats breaks;
};

class WorkoutService {
public:
  struct Options {
    std::filesystem::path temp_root;
    std::chrono::seconds job_ttl{3600};
    config::WorkoutDefaults defaults;
  };

  // `assemblers` are tried in order; later ones are fallbacks.
  WorkoutService(std::shared_ptr<ExerciseCatalog> catalog,
                 std::shared_ptr<WorkoutPlanner> planner,
                 std::shared_ptr<JobStore> store,
                 std::shared_ptr<AssetResolver> resolver,
                 std::shared_ptr<BreakClipFactory> breaks,
                 std::shared_ptr<SegmentPreparer> preparer,
                 std::vector<std::shared_ptr<VideoAssembler>> assemblers,
                 std::shared_ptr<StreamPipeline> pipeline,
                 std::shared_ptr<const FfmpegCommands> commands,
                 Options options);

  std::vector<ExerciseRecord> listExercises() const;
  Result<ExerciseRecord> getExercise(const std::string& id_or_name) const;

  // 1.0 unless speed adjustment is enabled in the configuration.
  double speedMultiplier(Intensity intensity) const;
  Result<WorkoutSpec> buildSpec(std::vector<ExerciseRecord> exercises, const WorkoutConfig& config) const;

  // Named exercises concatenated and streamed straight from the encoder.
  Result<StreamStats> streamExercises(const std::vector<std::string>& names, const WorkoutConfig& config,
                                      const StreamPipeline::ChunkSink& sink,
                                      const std::atomic_bool* cancelled = nullptr);

  // Plans and resolves a workout and keeps it for a later streamWorkout().
  Result<StagedWorkout> prepareWorkout(const WorkoutConfig& config, int total_duration,
                                       const std::string& name,
                                       std::optional<std::string> workout_id = std::nullopt);

  // Streams a staged workout with buffered startup: exercises cut to the work
  // interval, a break clip between consecutive exercises.
  Result<StreamStats> streamWorkout(const std::string& workout_id, const StreamPipeline::ChunkSink& sink,
                                    const std::atomic_bool* cancelled = nullptr);

  // Plans, resolves, trims, inserts breaks and assembles one output file.
  Result<GeneratedWorkout> generateWorkoutVideo(const WorkoutConfig& config, int total_duration,
                                                const std::string& name);

  // Assembles prepared segments with the first assembler that succeeds.
  Result<AssemblyReport> assemble(const std::vector<Segment>& segments, GenerationJob& job);

  CacheReport cacheStats() const;

private:
  Result<std::vector<ExerciseRecord>> plan(const WorkoutConfig& config, int total_duration);

  std::shared_ptr<ExerciseCatalog> catalog_;
  std::shared_ptr<WorkoutPlanner> planner_;
  std::shared_ptr<JobStore> store_;
  std::shared_ptr<AssetResolver> resolver_;
  std::shared_ptr<BreakClipFactory> breaks_;
  std::shared_ptr<SegmentPreparer> preparer_;
  std::vector<std::shared_ptr<VideoAssembler>> assemblers_;
  std::shared_ptr<StreamPipeline> pipeline_;
  std::shared_ptr<const FfmpegCommands> commands_;
  Options options_;
};

} // namespace workout_service
