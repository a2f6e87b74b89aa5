#include "asset_resolver.hpp"
#include "common/ids.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <future>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace workout_service {

namespace {
double secondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

bool usableFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > 0;
}
}

AssetResolver::AssetResolver(std::shared_ptr<DownloadService> downloader, Options options)
  : downloader_(std::move(downloader)),
    options_(std::move(options)),
    pool_(static_cast<unsigned int>(options_.max_parallel == 0 ? 1 : options_.max_parallel)) {
  fs::create_directories(options_.cache_dir);
}

std::string AssetResolver::cacheFileName(const std::string& url) {
  std::string path = url;
  if (auto cut = path.find_first_of("?#"); cut != std::string::npos) {
    path.erase(cut);
  }
  std::string ext = WORKOUT_DEFAULT_VIDEO_EXT;
  auto slash = path.rfind('/');
  auto dot = path.rfind('.');
  if (dot != std::string::npos && (slash == std::string::npos || dot > slash) && dot + 1 < path.size()) {
    ext = path.substr(dot);
  }
  return common::sha256Hex(url).substr(0, 16) + ext;
}

fs::path AssetResolver::cachePathFor(const std::string& url) const {
  return options_.cache_dir / cacheFileName(url);
}

Result<ResolvedAsset> AssetResolver::resolve(const ExerciseRecord& exercise) {
  if (exercise.video_url.empty()) {
    return makeError(ErrorKind::AssetUnavailable, "exercise '" + exercise.name + "' has no video");
  }
  return exercise.isRemote() ? resolveRemote(exercise) : resolveLocal(exercise);
}

Result<ResolvedAsset> AssetResolver::resolveRemote(const ExerciseRecord& exercise) {
  const auto& url = exercise.video_url;
  auto cached = cachePathFor(url);
  if (usableFile(cached)) {
    common::Logger::debug("cache hit for " + exercise.name + ": " + cached.string());
    std::error_code ec;
    return ResolvedAsset{url, cached.string(), fs::file_size(cached, ec)};
  }

  auto start = std::chrono::steady_clock::now();
  fs::path part = cached;
  part += "." + common::newUuid() + WORKOUT_PART_FILE_SUFFIX;

  common::Logger::info("downloading " + exercise.name + " from " + url);
  auto res = downloader_->download(url, part.string(), options_.auth_token);
  if (!res) {
    std::error_code ec;
    fs::remove(part, ec);
    std::ostringstream oss;
    oss << "download of '" << exercise.name << "' failed after " << secondsSince(start) << "s: " << res.error();
    common::Logger::error(oss.str());
    return makeError(ErrorKind::AssetUnavailable, oss.str());
  }

  // Another job may have placed the same key meanwhile; rename replaces it
  // with identical content.
  std::error_code ec;
  fs::rename(part, cached, ec);
  if (ec) {
    fs::remove(part, ec);
    return makeError(ErrorKind::AssetUnavailable,
                     "could not place '" + exercise.name + "' into the cache: " + ec.message());
  }

  std::ostringstream oss;
  oss << "downloaded " << exercise.name << " (" << res.value() << " bytes) in " << secondsSince(start) << "s";
  common::Logger::info(oss.str());
  return ResolvedAsset{url, cached.string(), res.value()};
}

Result<ResolvedAsset> AssetResolver::resolveLocal(const ExerciseRecord& exercise) const {
  fs::path given(exercise.video_url);
  std::vector<fs::path> candidates;
  if (given.is_absolute()) {
    candidates.push_back(given);
  } else {
    candidates.push_back(options_.project_root / given);
    candidates.push_back(options_.local_assets_dir / given);
  }

  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return ResolvedAsset{exercise.video_url, candidate.string(), fs::file_size(candidate, ec)};
    }
  }

  common::Logger::warn("video file not found for " + exercise.name + ": " + exercise.video_url);
  return makeError(ErrorKind::AssetUnavailable,
                   "video for '" + exercise.name + "' not found: " + exercise.video_url);
}

Result<std::vector<ResolvedAsset>> AssetResolver::resolveAll(const std::vector<ExerciseRecord>& exercises) {
  auto start = std::chrono::steady_clock::now();

  std::map<std::string, std::future<Result<ResolvedAsset>>> pending;
  for (const auto& exercise : exercises) {
    if (pending.count(exercise.video_url)) continue;
    pending.emplace(exercise.video_url,
                    pool_.commit([this, exercise]() { return resolve(exercise); }));
  }

  std::map<std::string, Result<ResolvedAsset>> done;
  for (auto& [ref, future] : pending) {
    done.emplace(ref, future.get());
  }

  std::vector<ResolvedAsset> assets;
  assets.reserve(exercises.size());
  for (const auto& exercise : exercises) {
    const auto& res = done.at(exercise.video_url);
    if (!res) {
      return std::unexpected(res.error());
    }
    assets.push_back(res.value());
  }

  std::ostringstream oss;
  oss << "resolved " << exercises.size() << " assets (" << pending.size() << " distinct) in "
      << secondsSince(start) << "s";
  common::Logger::info(oss.str());
  return assets;
}

AssetResolver::CacheStats AssetResolver::stats() const {
  CacheStats stats;
  std::error_code ec;
  for (fs::directory_iterator it(options_.cache_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().string().ends_with(WORKOUT_PART_FILE_SUFFIX)) continue;
    ++stats.files;
    stats.bytes += it->file_size(ec);
  }
  return stats;
}

} // namespace workout_service
