#include "subprocess_runner.hpp"
#include "common/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace workout_service {

namespace {
using Clock = std::chrono::steady_clock;

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

int decodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

std::chrono::milliseconds remaining(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}
}

PosixRunningProcess::PosixRunningProcess(int pid, int stdout_fd, int stderr_fd)
  : pid_(pid), stdout_fd_(stdout_fd) {
  stderr_thread_ = std::jthread([this, stderr_fd]() { drainStderr(stderr_fd); });
}

PosixRunningProcess::~PosixRunningProcess() {
  kill();
  closeFd(stdout_fd_);
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
}

void PosixRunningProcess::drainStderr(int fd) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    std::lock_guard<std::mutex> lock{stderr_mtx_};
    stderr_tail_.append(buf, static_cast<size_t>(n));
    if (stderr_tail_.size() > kStderrTail) {
      stderr_tail_.erase(0, stderr_tail_.size() - kStderrTail);
    }
  }
  ::close(fd);
}

std::string PosixRunningProcess::stderrText() const {
  std::lock_guard<std::mutex> lock{stderr_mtx_};
  return stderr_tail_;
}

ReadStatus PosixRunningProcess::read(std::string& out, size_t max_bytes, std::chrono::milliseconds timeout) {
  if (stdout_fd_ < 0) {
    return ReadStatus::Eof;
  }
  auto deadline = Clock::now() + timeout;
  while (true) {
    pollfd pfd{stdout_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(remaining(deadline).count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      return ReadStatus::Error;
    }
    if (ready == 0) {
      return ReadStatus::Timeout;
    }

    auto old_size = out.size();
    out.resize(old_size + max_bytes);
    ssize_t n = ::read(stdout_fd_, out.data() + old_size, max_bytes);
    if (n < 0) {
      out.resize(old_size);
      if (errno == EINTR || errno == EAGAIN) continue;
      return ReadStatus::Error;
    }
    out.resize(old_size + static_cast<size_t>(n));
    return n == 0 ? ReadStatus::Eof : ReadStatus::Data;
  }
}

bool PosixRunningProcess::reap(bool block) {
  if (exit_code_) return true;
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
  } while (r < 0 && errno == EINTR);
  if (r == pid_) {
    exit_code_ = decodeStatus(status);
    return true;
  }
  if (r < 0) {
    // Already reaped elsewhere; nothing left to wait for.
    exit_code_ = -1;
    return true;
  }
  return false;
}

// Leftover helpers in the group would hold the stderr pipe open.
void PosixRunningProcess::finish() {
  std::lock_guard<std::mutex> lock{finish_mtx_};
  if (finished_) return;
  finished_ = true;
  ::kill(-pid_, SIGKILL);
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
}

std::expected<int, std::string> PosixRunningProcess::wait(std::chrono::milliseconds timeout) {
  auto deadline = Clock::now() + timeout;
  {
    std::lock_guard<std::mutex> lock{state_mtx_};
    while (!reap(false)) {
      if (Clock::now() >= deadline) {
        return std::unexpected("process " + std::to_string(pid_) + " still running");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  finish();
  return *exit_code_;
}

void PosixRunningProcess::kill() {
  {
    std::lock_guard<std::mutex> lock{state_mtx_};
    if (!exit_code_) {
      ::kill(-pid_, SIGKILL);
      reap(true);
    }
  }
  finish();
}

bool PosixRunningProcess::alive() {
  std::lock_guard<std::mutex> lock{state_mtx_};
  return !reap(false);
}

std::expected<std::unique_ptr<RunningProcess>, std::string> SubprocessRunner::start(const CommandSpec& command) {
  if (command.args.empty()) {
    return std::unexpected("empty command");
  }
  common::Logger::debug("exec: " + command.describe());

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto closeAll = [&]() {
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
      closeFd(*fd);
    }
  };

  if ((command.stdout_mode == OutputMode::Pipe && ::pipe2(out_pipe, O_CLOEXEC) != 0) ||
      ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    std::string err = std::strerror(errno);
    closeAll();
    return std::unexpected("pipe failed: " + err);
  }

  std::vector<char*> argv;
  argv.reserve(command.args.size() + 1);
  for (const auto& arg : command.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    std::string err = std::strerror(errno);
    closeAll();
    return std::unexpected("fork failed: " + err);
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDWR);
    ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1] >= 0 ? out_pipe[1] : devnull, STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    int err = errno;
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  closeFd(out_pipe[1]);
  closeFd(err_pipe[1]);
  closeFd(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  closeFd(exec_pipe[0]);

  if (n > 0) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    closeAll();
    return std::unexpected("cannot execute " + command.args[0] + ": " + std::strerror(child_errno));
  }

  return std::make_unique<PosixRunningProcess>(pid, out_pipe[0], err_pipe[0]);
}

std::expected<ProcessResult, std::string> SubprocessRunner::run(const CommandSpec& command,
                                                                std::chrono::milliseconds timeout) {
  auto started = start(command);
  if (!started) {
    return std::unexpected(started.error());
  }
  auto& process = *started.value();
  auto deadline = Clock::now() + timeout;

  ProcessResult result;
  while (true) {
    auto status = process.read(result.stdout_data, 64 * 1024, remaining(deadline));
    if (status == ReadStatus::Data) continue;
    if (status == ReadStatus::Timeout) {
      result.timed_out = true;
    }
    break;
  }

  if (!result.timed_out) {
    auto code = process.wait(remaining(deadline));
    if (code) {
      result.exit_code = code.value();
    } else {
      result.timed_out = true;
    }
  }
  if (result.timed_out) {
    process.kill();
    common::Logger::warn("timed out after " + std::to_string(timeout.count()) + "ms: " + command.describe());
  }
  result.stderr_data = process.stderrText();
  return result;
}

} // namespace workout_service
