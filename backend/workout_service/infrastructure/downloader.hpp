#pragma once
#include <chrono>
#include <string>
#include <expected>
#include <functional>
#include <curl/curl.h>
#include "domain/download_service.hpp"

namespace workout_service {
// libcurl downloader. Every call uses its own easy handle so one instance can
// serve the whole download pool.
class Downloader : public DownloadService {
public:
  Downloader(std::chrono::seconds timeout, size_t chunk_size);
  ~Downloader() override;

  std::expected<uint64_t, std::string> download(
    const std::string& url,
    const std::string& output_path,
    const std::string& auth_token,
    ProgressCallback progress_callback = nullptr
  ) override;

private:
  struct Transfer {
    std::FILE* file{nullptr};
    uint64_t written{0};
    ProgressCallback progress;
  };

  static size_t writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata);
  static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                              curl_off_t ultotal, curl_off_t ulnow);

  std::chrono::seconds timeout_;
  size_t chunk_size_;
};
}
