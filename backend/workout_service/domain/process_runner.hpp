#pragma once
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace workout_service {

// Where the child's stdout goes. Encoders writing to a file discard it,
// probes and streaming encoders pipe it back.
enum class OutputMode { Discard, Pipe };

struct CommandSpec {
  std::vector<std::string> args;  // args[0] is the program
  OutputMode stdout_mode{OutputMode::Discard};

  std::string describe() const {
    std::string out;
    for (const auto& a : args) {
      if (!out.empty()) out += ' ';
      out += a;
    }
    return out;
  }
};

struct ProcessResult {
  int exit_code{-1};
  bool timed_out{false};
  std::string stdout_data;
  std::string stderr_data;

  bool ok() const { return !timed_out && exit_code == 0; }
};

// Last `max_bytes` of a diagnostic stream.
inline std::string excerpt(const std::string& text, size_t max_bytes = 2000) {
  return text.size() <= max_bytes ? text : text.substr(text.size() - max_bytes);
}

enum class ReadStatus { Data, Eof, Timeout, Error };

// A child process whose stdout is consumed incrementally. stderr is drained
// concurrently by the implementation. Destroying a RunningProcess kills and
// reaps the child if it is still alive.
class RunningProcess {
public:
  virtual ~RunningProcess() = default;

  // Appends at most `max_bytes` to `out`. Waits up to `timeout` for data.
  virtual ReadStatus read(std::string& out, size_t max_bytes, std::chrono::milliseconds timeout) = 0;
  // Waits for the child to exit. Returns the exit code, or nothing on timeout.
  virtual std::expected<int, std::string> wait(std::chrono::milliseconds timeout) = 0;
  // SIGKILL to the child's process group, then reap.
  virtual void kill() = 0;
  virtual bool alive() = 0;
  virtual int pid() const = 0;
  // Tail of everything the child wrote to stderr so far.
  virtual std::string stderrText() const = 0;
};

class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;
  // Runs to completion. A child still running at `timeout` is killed and the
  // result is flagged timed_out. Fails only when the process cannot be started.
  virtual std::expected<ProcessResult, std::string> run(const CommandSpec& command,
                                                        std::chrono::milliseconds timeout) = 0;
  virtual std::expected<std::unique_ptr<RunningProcess>, std::string> start(const CommandSpec& command) = 0;
};

} // namespace workout_service
