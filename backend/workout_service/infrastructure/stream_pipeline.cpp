#include "stream_pipeline.hpp"
#include "common/logger.hpp"
#include <algorithm>

namespace workout_service {

namespace {
using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

milliseconds left(Clock::time_point deadline) {
  auto ms = std::chrono::duration_cast<milliseconds>(deadline - Clock::now());
  return ms.count() > 0 ? ms : milliseconds(0);
}

// Grace period for the encoder to exit after closing its stdout.
constexpr milliseconds kExitGrace{10000};
}

StreamPipeline::StreamPipeline(std::shared_ptr<ProcessRunner> runner, config::StreamingConfig options)
  : runner_(std::move(runner)), options_(options) {}

Result<void> StreamPipeline::deliver(const std::string& chunk, const ChunkSink& sink,
                                     const std::atomic_bool* cancelled, StreamStats& stats,
                                     Clock::time_point started) {
  if (cancelled && cancelled->load()) {
    return makeError(ErrorKind::Cancelled, "stream cancelled");
  }
  if (stats.chunks == 0) {
    stats.first_chunk_bytes = chunk.size();
    stats.time_to_first_chunk = std::chrono::duration_cast<milliseconds>(Clock::now() - started);
    common::Logger::info("first chunk of " + std::to_string(chunk.size()) + " bytes after " +
                         std::to_string(stats.time_to_first_chunk.count()) + "ms");
  }
  if (!sink(chunk)) {
    return makeError(ErrorKind::Cancelled, "consumer disconnected");
  }
  ++stats.chunks;
  stats.bytes += chunk.size();
  return {};
}

Result<void> StreamPipeline::awaitExit(RunningProcess& process, StreamStats& stats) {
  auto code = process.wait(kExitGrace);
  if (!code) {
    process.kill();
    return makeError(ErrorKind::StreamTimeout, "encoder did not exit after end of output",
                     excerpt(process.stderrText()));
  }
  stats.exit_code = code.value();
  if (stats.exit_code != 0) {
    return makeError(ErrorKind::EncodeFailed, "encoder exited with code " + std::to_string(stats.exit_code),
                     excerpt(process.stderrText()));
  }
  return {};
}

Result<StreamStats> StreamPipeline::streamDirect(const CommandSpec& command, const ChunkSink& sink,
                                                 const std::atomic_bool* cancelled) {
  auto started = Clock::now();
  auto process = runner_->start(command);
  if (!process) {
    return makeError(ErrorKind::EncodeFailed, "could not start encoder: " + process.error());
  }
  auto& encoder = *process.value();
  auto deadline = started + options_.direct_total_timeout;
  auto read_timeout = std::chrono::duration_cast<milliseconds>(options_.direct_read_timeout);

  StreamStats stats;
  std::string chunk;
  while (true) {
    chunk.clear();
    auto wait = std::min(read_timeout, left(deadline));
    auto status = encoder.read(chunk, options_.direct_chunk_size, wait);
    if (status == ReadStatus::Data) {
      if (auto res = deliver(chunk, sink, cancelled, stats, started); !res) {
        encoder.kill();
        common::Logger::info("direct stream stopped: " + res.error().message);
        return std::unexpected(res.error());
      }
      continue;
    }
    if (status == ReadStatus::Eof) {
      break;
    }
    encoder.kill();
    if (status == ReadStatus::Timeout) {
      bool total = left(deadline).count() == 0;
      common::Logger::error(std::string("direct stream timed out (") + (total ? "total" : "read") + ")");
      return makeError(ErrorKind::StreamTimeout,
                       total ? "stream exceeded its total time limit" : "encoder produced no output in time",
                       excerpt(encoder.stderrText()));
    }
    return makeError(ErrorKind::EncodeFailed, "reading encoder output failed", excerpt(encoder.stderrText()));
  }

  if (auto res = awaitExit(encoder, stats); !res) {
    common::Logger::error("direct stream failed: " + res.error().describe());
    return std::unexpected(res.error());
  }
  common::Logger::info("direct stream finished: " + std::to_string(stats.bytes) + " bytes in " +
                       std::to_string(stats.chunks) + " chunks");
  return stats;
}

Result<StreamStats> StreamPipeline::streamBuffered(const CommandSpec& command, const ChunkSink& sink,
                                                   const std::atomic_bool* cancelled) {
  auto started = Clock::now();
  auto process = runner_->start(command);
  if (!process) {
    return makeError(ErrorKind::EncodeFailed, "could not start encoder: " + process.error());
  }
  auto& encoder = *process.value();

  StreamStats stats;
  std::string buffer;
  buffer.reserve(options_.startup_buffer_size);
  auto startup_deadline = started + options_.startup_total_timeout;
  auto startup_read = std::chrono::duration_cast<milliseconds>(options_.startup_read_timeout);
  bool eof = false;

  while (buffer.size() < options_.startup_buffer_size) {
    if (cancelled && cancelled->load()) {
      encoder.kill();
      return makeError(ErrorKind::Cancelled, "stream cancelled");
    }
    auto wait = std::min(startup_read, left(startup_deadline));
    auto status = encoder.read(buffer, options_.startup_buffer_size - buffer.size(), wait);
    if (status == ReadStatus::Data) continue;
    if (status == ReadStatus::Eof) {
      eof = true;
      break;
    }
    encoder.kill();
    if (status == ReadStatus::Timeout) {
      common::Logger::error("encoder startup timed out with " + std::to_string(buffer.size()) + " bytes buffered");
      return makeError(ErrorKind::StreamTimeout, "encoder startup timed out", excerpt(encoder.stderrText()));
    }
    return makeError(ErrorKind::EncodeFailed, "reading encoder output failed", excerpt(encoder.stderrText()));
  }

  if (buffer.empty()) {
    auto code = encoder.wait(kExitGrace);
    encoder.kill();
    std::string reason = "encoder produced no output";
    if (code) {
      reason += " (exit code " + std::to_string(code.value()) + ")";
    }
    return makeError(ErrorKind::EncodeFailed, reason, excerpt(encoder.stderrText()));
  }

  if (auto res = deliver(buffer, sink, cancelled, stats, started); !res) {
    encoder.kill();
    return std::unexpected(res.error());
  }
  buffer.clear();
  buffer.shrink_to_fit();

  auto relay_read = std::chrono::duration_cast<milliseconds>(options_.relay_read_timeout);
  std::string chunk;
  while (!eof) {
    chunk.clear();
    auto status = encoder.read(chunk, options_.relay_chunk_size, relay_read);
    if (status == ReadStatus::Data) {
      if (auto res = deliver(chunk, sink, cancelled, stats, started); !res) {
        encoder.kill();
        common::Logger::info("buffered stream stopped: " + res.error().message);
        return std::unexpected(res.error());
      }
      continue;
    }
    if (status == ReadStatus::Eof) {
      eof = true;
      break;
    }
    encoder.kill();
    if (status == ReadStatus::Timeout) {
      return makeError(ErrorKind::StreamTimeout, "encoder stalled mid-stream", excerpt(encoder.stderrText()));
    }
    return makeError(ErrorKind::EncodeFailed, "reading encoder output failed", excerpt(encoder.stderrText()));
  }

  if (auto res = awaitExit(encoder, stats); !res) {
    common::Logger::error("buffered stream failed: " + res.error().describe());
    return std::unexpected(res.error());
  }
  common::Logger::info("buffered stream finished: " + std::to_string(stats.bytes) + " bytes in " +
                       std::to_string(stats.chunks) + " chunks");
  return stats;
}

} // namespace workout_service
