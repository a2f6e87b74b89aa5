#pragma once
#include <chrono>

// project
#include "domain/format_prober.hpp"

// ffmpeg
extern "C" {
  #include <libavcodec/avcodec.h>
  #include <libavformat/avformat.h>
  #include <libavutil/log.h>
}

namespace workout_service {

// In-process alternative to FfprobeProber, reading the container through
// libavformat instead of spawning ffprobe. A probe that runs past the timeout
// is interrupted and reported as inconclusive.
class LibavProber : public FormatProber {
public:
  explicit LibavProber(std::chrono::seconds timeout, int loglevel = AV_LOG_ERROR);
  std::optional<VideoFormatDescriptor> probe(const std::string& path) override;

private:
  static int interruptCallback(void* opaque);

  std::chrono::seconds timeout_;
};

} // namespace workout_service
