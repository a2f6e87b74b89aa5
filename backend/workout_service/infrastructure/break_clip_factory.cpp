#include "break_clip_factory.hpp"
#include "common/ids.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace fs = std::filesystem;

namespace workout_service {

namespace {
bool nonEmptyFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > 0;
}
}

BreakClipFactory::BreakClipFactory(std::shared_ptr<ProcessRunner> runner,
                                   std::shared_ptr<const FfmpegCommands> commands,
                                   std::shared_ptr<FormatProber> prober,
                                   Options options)
  : runner_(std::move(runner)),
    commands_(std::move(commands)),
    prober_(std::move(prober)),
    options_(std::move(options)) {
  fs::create_directories(options_.cache_dir);
}

std::string BreakClipFactory::fileName(int duration) {
  return "break_" + std::to_string(duration) + "s.mp4";
}

bool BreakClipFactory::isCommon(int duration) const {
  const auto& common = options_.common_durations;
  return std::find(common.begin(), common.end(), duration) != common.end();
}

std::optional<std::string> BreakClipFactory::backgroundImage() const {
  for (const auto& candidate : options_.image_candidates) {
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::shared_ptr<std::mutex> BreakClipFactory::lockFor(int duration) {
  std::lock_guard<std::mutex> lock{locks_mtx_};
  auto& slot = locks_[duration];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

Result<std::string> BreakClipFactory::generate(int duration, const fs::path& output) {
  auto image = backgroundImage();
  if (!image) {
    return makeError(ErrorKind::AssetUnavailable, "background image for break clips not found");
  }

  fs::path part = output;
  part += "." + common::newUuid() + WORKOUT_PART_FILE_SUFFIX;

  auto start = std::chrono::steady_clock::now();
  auto cmd = commands_->breakClip(*image, duration, part.string());
  auto result = runner_->run(cmd, options_.encode_timeout);

  std::error_code ec;
  if (!result) {
    fs::remove(part, ec);
    return makeError(ErrorKind::EncodeFailed, "break clip " + std::to_string(duration) + "s: " + result.error());
  }
  if (!result->ok() || !nonEmptyFile(part)) {
    fs::remove(part, ec);
    auto reason = result->timed_out ? std::string("timed out")
                                    : "failed with exit code " + std::to_string(result->exit_code);
    return makeError(ErrorKind::EncodeFailed, "break clip " + std::to_string(duration) + "s " + reason,
                     excerpt(result->stderr_data));
  }

  fs::rename(part, output, ec);
  if (ec) {
    fs::remove(part, ec);
    return makeError(ErrorKind::Internal, "could not place break clip " + output.string());
  }

  std::ostringstream oss;
  oss << "created break clip " << output.filename().string() << " in "
      << std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count() << "s";
  common::Logger::info(oss.str());
  return output.string();
}

size_t BreakClipFactory::warmUp() {
  if (!backgroundImage()) {
    common::Logger::warn("break warm-up skipped, background image not found");
    return 0;
  }

  const auto& target = commands_->target();
  size_t ready = 0;
  for (int duration : options_.common_durations) {
    auto guard = lockFor(duration);
    std::lock_guard<std::mutex> lock{*guard};

    auto path = options_.cache_dir / fileName(duration);
    if (nonEmptyFile(path)) {
      auto desc = prober_->probe(path.string());
      if (desc && desc->width == target.width && desc->height == target.height) {
        ++ready;
        continue;
      }
      common::Logger::warn("cached break " + path.filename().string() + " has the wrong format, regenerating");
      std::error_code ec;
      fs::remove(path, ec);
    }

    auto res = generate(duration, path);
    if (res) {
      ++ready;
    } else {
      common::Logger::error("break warm-up for " + std::to_string(duration) + "s failed: " + res.error().describe());
    }
  }
  common::Logger::info("break cache ready: " + std::to_string(ready) + "/" +
                       std::to_string(options_.common_durations.size()));
  return ready;
}

Result<std::string> BreakClipFactory::getBreak(int duration, const fs::path& scratch_dir) {
  if (duration <= 0) {
    return makeError(ErrorKind::InvalidRequest, "break duration must be positive");
  }

  fs::path path = isCommon(duration) ? options_.cache_dir / fileName(duration)
                                     : scratch_dir / fileName(duration);
  if (nonEmptyFile(path)) {
    return path.string();
  }

  auto guard = lockFor(duration);
  std::lock_guard<std::mutex> lock{*guard};
  if (nonEmptyFile(path)) {
    return path.string();
  }
  return generate(duration, path);
}

BreakClipFactory::CacheStats BreakClipFactory::stats() const {
  CacheStats stats;
  std::error_code ec;
  for (fs::directory_iterator it(options_.cache_dir, ec), end; !ec && it != end; it.increment(ec)) {
    auto name = it->path().filename().string();
    if (!it->is_regular_file(ec) || !name.starts_with("break_") || !name.ends_with("s.mp4")) continue;
    ++stats.files;
    stats.bytes += it->file_size(ec);
    auto digits = name.substr(6, name.size() - 6 - 5);
    if (!digits.empty() && std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
      stats.durations.push_back(std::stoi(digits));
    }
  }
  std::sort(stats.durations.begin(), stats.durations.end());
  return stats;
}

} // namespace workout_service
