#include "application/workout_service.hpp"
#include "common/config/config.hpp"
#include "common/logger.hpp"
#include "common/restful/http_server.hpp"
#include "common/thread_pool.hpp"
#include "infrastructure/asset_resolver.hpp"
#include "infrastructure/break_clip_factory.hpp"
#include "infrastructure/downloader.hpp"
#include "infrastructure/ffmpeg_commands.hpp"
#include "infrastructure/ffprobe_prober.hpp"
#include "infrastructure/json_exercise_catalog.hpp"
#include "infrastructure/libav_prober.hpp"
#include "infrastructure/memory_job_store.hpp"
#include "infrastructure/progressive_concatenator.hpp"
#include "infrastructure/random_workout_planner.hpp"
#include "infrastructure/segment_preparer.hpp"
#include "infrastructure/sequential_assembler.hpp"
#include "infrastructure/stream_pipeline.hpp"
#include "infrastructure/subprocess_runner.hpp"
#include "interface/rest_api_handler.hpp"
#include <csignal>
#include <filesystem>
#include <functional>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

using common::Logger;

int main(int argc, char** argv) {
  try {
    auto& cfg = config::Config::getInstance();
    if (argc > 1) {
      if (auto loaded = cfg.loadFromFile(argv[1]); !loaded) {
        Logger::error("Failed to load config " + std::string(argv[1]) + ": " + loaded.error());
        return 1;
      }
    }
    if (!Logger::setLevel(cfg.getLogLevel())) {
      Logger::warn("Unknown log level '" + cfg.getLogLevel() + "', keeping info");
    }
    std::signal(SIGPIPE, SIG_IGN);

    const auto& storage = cfg.getStorage();
    const auto& encoder = cfg.getEncoder();
    std::filesystem::create_directories(storage.cache_dir);
    std::filesystem::create_directories(storage.break_cache_dir);
    std::filesystem::create_directories(storage.temp_root);

    auto catalog = workout_service::JsonExerciseCatalog::fromFile(storage.catalog_path);
    if (!catalog) {
      Logger::error(catalog.error());
      return 1;
    }

    auto runner = std::make_shared<workout_service::SubprocessRunner>();
    auto commands = std::make_shared<const workout_service::FfmpegCommands>(encoder);

    std::shared_ptr<workout_service::FormatProber> prober;
    if (encoder.prober == "libav") {
      prober = std::make_shared<workout_service::LibavProber>(encoder.probe_timeout);
    } else {
      prober = std::make_shared<workout_service::FfprobeProber>(runner, commands, encoder.probe_timeout);
    }

    const auto& download = cfg.getDownload();
    auto downloader = std::make_shared<workout_service::Downloader>(download.timeout, download.chunk_size);
    auto resolver = std::make_shared<workout_service::AssetResolver>(
      downloader,
      workout_service::AssetResolver::Options{
        storage.project_root, storage.local_assets_dir, storage.cache_dir,
        download.auth_token, download.max_parallel});

    auto breaks = std::make_shared<workout_service::BreakClipFactory>(
      runner, commands, prober,
      workout_service::BreakClipFactory::Options{
        storage.break_cache_dir, storage.break_image_candidates,
        cfg.getBreaks().common_durations, encoder.encode_timeout});

    auto preparer = std::make_shared<workout_service::SegmentPreparer>(runner, commands, encoder.encode_timeout);
    std::vector<std::shared_ptr<workout_service::VideoAssembler>> assemblers{
      std::make_shared<workout_service::ProgressiveConcatenator>(runner, commands, prober, encoder.encode_timeout),
      std::make_shared<workout_service::SequentialAssembler>(runner, commands, prober, encoder.encode_timeout)};
    auto pipeline = std::make_shared<workout_service::StreamPipeline>(runner, cfg.getStreaming());

    const auto& workout = cfg.getWorkout();
    auto planner = std::make_shared<workout_service::RandomWorkoutPlanner>(workout.seconds_per_exercise,
                                                                           workout.count_from_intervals);
    auto store = std::make_shared<workout_service::MemoryJobStore>();

    auto service = std::make_shared<workout_service::WorkoutService>(
      std::make_shared<workout_service::JsonExerciseCatalog>(std::move(catalog.value())),
      planner, store, resolver, breaks, preparer, assemblers, pipeline, commands,
      workout_service::WorkoutService::Options{storage.temp_root, cfg.getJobStore().ttl, workout});

    std::jthread warm_up([breaks]() { breaks->warmUp(); });

    const auto& server_cfg = cfg.getServer();
    int io_threads = server_cfg.io_threads > 0 ? server_cfg.io_threads : 1;
    boost::asio::io_context ioc{io_threads};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(server_cfg.host), server_cfg.port};

    auto stream_pool = std::make_shared<common::ThreadPool>(static_cast<unsigned int>(server_cfg.stream_workers));
    auto api_handler = std::make_shared<workout_service::RestApiHandler>(
      service, workout, cfg.getStreaming().relay_chunk_size);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, stream_pool};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int sig) {
      Logger::info("Received signal " + std::to_string(sig) + ", shutting down");
      http_server.stop();
      sweep_timer.cancel();
      ioc.stop();
    });

    boost::asio::steady_timer sweep_timer{ioc};
    std::function<void()> schedule_sweep = [&]() {
      sweep_timer.expires_after(std::chrono::seconds{60});
      sweep_timer.async_wait([&](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto evicted = store->evictExpired(); evicted > 0) {
          Logger::debug("evicted " + std::to_string(evicted) + " expired workouts");
        }
        schedule_sweep();
      });
    };
    schedule_sweep();

    Logger::info("HTTP Server listening on " + cfg.getServerIpPort());
    http_server.run();

    std::vector<std::jthread> io_workers;
    for (int i = 1; i < io_threads; ++i) {
      io_workers.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    io_workers.clear();

    Logger::info("Server stopped");
    return 0;
  } catch (const std::exception& e) {
    Logger::error(std::string("Error: ") + e.what());
    return 1;
  }
}
