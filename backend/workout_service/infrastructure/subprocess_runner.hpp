#pragma once
#include "domain/process_runner.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace workout_service {

// fork/exec backed process. The child leads its own process group; kill()
// and the destructor signal the whole group and reap the leader.
class PosixRunningProcess : public RunningProcess {
public:
  PosixRunningProcess(int pid, int stdout_fd, int stderr_fd);
  ~PosixRunningProcess() override;

  PosixRunningProcess(const PosixRunningProcess&) = delete;
  PosixRunningProcess& operator=(const PosixRunningProcess&) = delete;

  ReadStatus read(std::string& out, size_t max_bytes, std::chrono::milliseconds timeout) override;
  std::expected<int, std::string> wait(std::chrono::milliseconds timeout) override;
  void kill() override;
  bool alive() override;
  int pid() const override { return pid_; }
  std::string stderrText() const override;

  static constexpr size_t kStderrTail = 64 * 1024;

private:
  bool reap(bool block);
  void finish();
  void drainStderr(int fd);

  const int pid_;
  int stdout_fd_;
  std::optional<int> exit_code_;
  std::mutex state_mtx_;
  std::mutex finish_mtx_;
  bool finished_{false};

  mutable std::mutex stderr_mtx_;
  std::string stderr_tail_;
  std::jthread stderr_thread_;
};

class SubprocessRunner : public ProcessRunner {
public:
  std::expected<ProcessResult, std::string> run(const CommandSpec& command,
                                                std::chrono::milliseconds timeout) override;
  std::expected<std::unique_ptr<RunningProcess>, std::string> start(const CommandSpec& command) override;
};

} // namespace workout_service
