#pragma once
#include <cstdint>
#include <string>
#include <expected>
#include <functional>

namespace workout_service {
class DownloadService {
public:
  using ProgressCallback = std::function<void(float)>;
  virtual ~DownloadService() = default;
  // Streams `url` into `output_path`. Returns the number of bytes written.
  virtual std::expected<uint64_t, std::string> download(
    const std::string& url,
    const std::string& output_path,
    const std::string& auth_token,
    ProgressCallback progress_callback = nullptr
  ) = 0;
};
}
