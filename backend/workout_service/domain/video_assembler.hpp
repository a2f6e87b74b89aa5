#pragma once
#include "errors.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace workout_service {

struct AssemblyReport {
  std::string strategy;
  bool homogeneous{false};
  size_t stream_copy_merges{0};
  size_t reencode_merges{0};
  size_t normalizations{0};
  size_t peak_accumulators{0};
};

// Merges ordered segment files into one output file. Implementations never
// reorder inputs and only write `output_path` once the result is complete.
class VideoAssembler {
public:
  // Called with the number of segments merged into the output so far.
  using ProgressCallback = std::function<void(size_t merged)>;

  virtual ~VideoAssembler() = default;
  virtual std::string name() const = 0;
  virtual Result<AssemblyReport> build(const std::vector<std::string>& segments,
                                       const std::filesystem::path& output_path,
                                       const std::filesystem::path& work_dir,
                                       ProgressCallback progress = nullptr) = 0;
};

} // namespace workout_service
