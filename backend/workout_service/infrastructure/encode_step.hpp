#pragma once
#include "domain/errors.hpp"
#include "domain/process_runner.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace workout_service {

// Runs an encoder writing to a file. Non-zero exit, timeout or a missing
// output file is EncodeFailed carrying `step` and the stderr excerpt.
Result<void> runEncodeStep(ProcessRunner& runner, const CommandSpec& command,
                           std::chrono::seconds timeout, const std::string& step,
                           const std::filesystem::path& expected_output);

// rename(), falling back to copy+remove across filesystems.
Result<void> moveFile(const std::filesystem::path& from, const std::filesystem::path& to);

} // namespace workout_service
