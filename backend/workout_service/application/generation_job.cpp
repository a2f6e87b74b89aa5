#include "generation_job.hpp"
#include "common/ids.hpp"
#include "common/logger.hpp"

namespace fs = std::filesystem;

namespace workout_service {

Result<std::unique_ptr<GenerationJob>> GenerationJob::create(const fs::path& temp_root, std::string id) {
  if (id.empty()) {
    id = common::newUuid();
  }
  auto dir = temp_root / ("job_" + id + "_" + common::newUuid().substr(0, 8));
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return makeError(ErrorKind::Internal, "cannot create job directory " + dir.string() + ": " + ec.message());
  }
  return std::unique_ptr<GenerationJob>(new GenerationJob(std::move(id), std::move(dir)));
}

GenerationJob::GenerationJob(std::string id, fs::path work_dir)
  : id_(std::move(id)), work_dir_(std::move(work_dir)) {}

GenerationJob::~GenerationJob() {
  cleanup();
}

void GenerationJob::advanceMerged(size_t merged) {
  if (merged > merged_) {
    merged_ = merged;
  }
}

void GenerationJob::cleanup() {
  std::lock_guard<std::mutex> lock{cleanup_mtx_};
  if (cleaned_) return;
  cleaned_ = true;

  std::error_code ec;
  auto removed = fs::remove_all(work_dir_, ec);
  if (ec) {
    common::Logger::warn("job " + id_ + ": cleanup of " + work_dir_.string() + " failed: " + ec.message());
  } else {
    common::Logger::debug("job " + id_ + ": removed " + std::to_string(removed) + " temp entries");
  }
}

} // namespace workout_service
