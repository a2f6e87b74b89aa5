#include "encode_step.hpp"
#include "common/logger.hpp"
#include "domain/video.hpp"

namespace fs = std::filesystem;

namespace workout_service {

Result<void> runEncodeStep(ProcessRunner& runner, const CommandSpec& command,
                           std::chrono::seconds timeout, const std::string& step,
                           const fs::path& expected_output) {
  auto result = runner.run(command, timeout);
  if (!result) {
    return makeError(ErrorKind::EncodeFailed, step + ": " + result.error());
  }
  if (result->timed_out) {
    return makeError(ErrorKind::EncodeFailed, step + " timed out", excerpt(result->stderr_data));
  }
  if (result->exit_code != 0) {
    return makeError(ErrorKind::EncodeFailed, step + " exited with code " + std::to_string(result->exit_code),
                     excerpt(result->stderr_data));
  }
  std::error_code ec;
  if (!fs::is_regular_file(expected_output, ec)) {
    return makeError(ErrorKind::EncodeFailed, step + " produced no output", excerpt(result->stderr_data));
  }
  return {};
}

Result<void> moveFile(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) {
    return {};
  }
  common::Logger::debug("rename " + from.string() + " failed (" + ec.message() + "), copying");
  fs::path part = to;
  part += WORKOUT_PART_FILE_SUFFIX;
  fs::copy_file(from, part, fs::copy_options::overwrite_existing, ec);
  if (!ec) {
    fs::rename(part, to, ec);
  }
  if (ec) {
    auto reason = ec.message();
    fs::remove(part, ec);
    return makeError(ErrorKind::Internal, "could not move " + from.string() + " to " + to.string() + ": " + reason);
  }
  fs::remove(from, ec);
  return {};
}

} // namespace workout_service
