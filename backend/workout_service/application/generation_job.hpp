#pragma once
#include "domain/errors.hpp"
#include "domain/video.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace workout_service {

// Scratch state of one request. Owns a private directory under the temp root
// that is removed when the job is destroyed, whatever the outcome.
class GenerationJob {
public:
  static Result<std::unique_ptr<GenerationJob>> create(const std::filesystem::path& temp_root,
                                                       std::string id = {});
  ~GenerationJob();

  GenerationJob(const GenerationJob&) = delete;
  GenerationJob& operator=(const GenerationJob&) = delete;

  const std::string& id() const { return id_; }
  const std::filesystem::path& workDir() const { return work_dir_; }

  std::filesystem::path tempPath(const std::string& file_name) const { return work_dir_ / file_name; }

  void setAssets(std::vector<ResolvedAsset> assets) { assets_ = std::move(assets); }
  const std::vector<ResolvedAsset>& assets() const { return assets_; }

  void setOutputPath(std::filesystem::path path) { output_path_ = std::move(path); }
  const std::filesystem::path& outputPath() const { return output_path_; }

  // Number of segments already merged into the output.
  void advanceMerged(size_t merged);
  size_t merged() const { return merged_; }

  void cleanup();

private:
  GenerationJob(std::string id, std::filesystem::path work_dir);

  std::string id_;
  std::filesystem::path work_dir_;
  std::filesystem::path output_path_;
  std::vector<ResolvedAsset> assets_;
  size_t merged_{0};

  std::mutex cleanup_mtx_;
  bool cleaned_{false};
};

} // namespace workout_service
