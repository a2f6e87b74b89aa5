#include "downloader.hpp"
#include <cstdio>
#include <memory>
#include <stdexcept>

namespace workout_service {
namespace {
struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct FileCloser {
  void operator()(std::FILE* f) const { std::fclose(f); }
};
}

Downloader::Downloader(std::chrono::seconds timeout, size_t chunk_size)
  : timeout_(timeout), chunk_size_(chunk_size) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize CURL");
  }
}

Downloader::~Downloader() {
  curl_global_cleanup();
}

std::expected<uint64_t, std::string> Downloader::download(
  const std::string& url,
  const std::string& output_path,
  const std::string& auth_token,
  ProgressCallback progress_callback
) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    return std::unexpected("Failed to create CURL handle");
  }

  std::unique_ptr<std::FILE, FileCloser> file(std::fopen(output_path.c_str(), "wb"));
  if (!file) {
    return std::unexpected("Failed to open output file " + output_path);
  }

  Transfer transfer{file.get(), 0, std::move(progress_callback)};

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &transfer);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(chunk_size_));

  std::unique_ptr<curl_slist, SlistDeleter> headers;
  if (!auth_token.empty()) {
    headers.reset(curl_slist_append(nullptr, ("Authorization: Bearer " + auth_token).c_str()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  auto res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    return std::unexpected(std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    return std::unexpected("HTTP error: " + std::to_string(http_code));
  }

  if (std::fflush(file.get()) != 0) {
    return std::unexpected("Failed to flush " + output_path);
  }
  return transfer.written;
}

size_t Downloader::writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* transfer = static_cast<Transfer*>(userdata);
  size_t written = std::fwrite(ptr, 1, size * nmemb, transfer->file);
  transfer->written += written;
  return written;
}

int Downloader::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                 curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  auto* transfer = static_cast<Transfer*>(clientp);
  if (dltotal > 0 && transfer->progress) {
    float progress = static_cast<float>(dlnow) / static_cast<float>(dltotal);
    transfer->progress(progress);
  }

  return 0;
}
}
