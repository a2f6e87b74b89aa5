#pragma once

// project
#include "common/thread_pool.hpp"
#include "domain/download_service.hpp"
#include "domain/errors.hpp"
#include "domain/exercise.hpp"
#include "domain/video.hpp"

// std
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace workout_service {

// Maps exercise video references to readable local files. Remote assets are
// downloaded once into the cache directory and served from there afterwards.
class AssetResolver {
public:
  struct Options {
    std::filesystem::path project_root;
    std::filesystem::path local_assets_dir;
    std::filesystem::path cache_dir;
    std::string auth_token;
    size_t max_parallel{4};
  };

  struct CacheStats {
    size_t files{0};
    uintmax_t bytes{0};
  };

  AssetResolver(std::shared_ptr<DownloadService> downloader, Options options);

  Result<ResolvedAsset> resolve(const ExerciseRecord& exercise);
  // Resolves on the download pool. The result keeps the order of `exercises`;
  // a reference appearing several times is fetched once.
  Result<std::vector<ResolvedAsset>> resolveAll(const std::vector<ExerciseRecord>& exercises);

  // <first 16 hex chars of sha256(url)><extension of the URL path, or .mov>
  static std::string cacheFileName(const std::string& url);
  std::filesystem::path cachePathFor(const std::string& url) const;
  CacheStats stats() const;

private:
  Result<ResolvedAsset> resolveRemote(const ExerciseRecord& exercise);
  Result<ResolvedAsset> resolveLocal(const ExerciseRecord& exercise) const;

  std::shared_ptr<DownloadService> downloader_;
  Options options_;
  common::ThreadPool pool_;
};

} // namespace workout_service
