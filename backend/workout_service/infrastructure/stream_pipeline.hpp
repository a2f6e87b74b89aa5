#pragma once
#include "common/config/config.hpp"
#include "domain/errors.hpp"
#include "domain/process_runner.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

namespace workout_service {

struct StreamStats {
  size_t bytes{0};
  size_t chunks{0};
  size_t first_chunk_bytes{0};
  std::chrono::milliseconds time_to_first_chunk{0};
  int exit_code{-1};
};

// Drives an encoder whose stdout is the stream. The process is killed and
// reaped on every path out of streamDirect/streamBuffered.
class StreamPipeline {
public:
  // Returns false when the consumer is gone; the encoder is then cancelled.
  using ChunkSink = std::function<bool(std::string_view)>;

  StreamPipeline(std::shared_ptr<ProcessRunner> runner, config::StreamingConfig options);

  // Relays every read as it arrives.
  Result<StreamStats> streamDirect(const CommandSpec& command, const ChunkSink& sink,
                                   const std::atomic_bool* cancelled = nullptr);

  // Holds output back until startup_buffer_size bytes (or EOF) so the first
  // unit carries the whole fragmented MP4 header, then relays larger reads.
  Result<StreamStats> streamBuffered(const CommandSpec& command, const ChunkSink& sink,
                                     const std::atomic_bool* cancelled = nullptr);

private:
  Result<void> deliver(const std::string& chunk, const ChunkSink& sink, const std::atomic_bool* cancelled,
                       StreamStats& stats, std::chrono::steady_clock::time_point started);
  Result<void> awaitExit(RunningProcess& process, StreamStats& stats);

  std::shared_ptr<ProcessRunner> runner_;
  config::StreamingConfig options_;
};

} // namespace workout_service
