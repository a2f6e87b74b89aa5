#pragma once
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <string>
#include "common/config/config.hpp"

namespace workout_service {

// Result of probing the first video stream of a file.
struct VideoFormatDescriptor {
  std::string codec_name;
  int width{0};
  int height{0};
  double fps{0.0};
  int64_t bitrate{0};      // 0 when the container does not report it
  double duration{0.0};    // seconds, 0 when unknown

  std::string debug() const {
    std::ostringstream oss;
    oss << "codec:" << codec_name << ",width:" << width << ",height:" << height
        << ",fps:" << fps << ",bitrate:" << bitrate << ",duration:" << duration;
    return oss.str();
  }
};

constexpr double kFpsTolerance = 1.0;

// Same codec and resolution, frame rates within kFpsTolerance.
inline bool equivalent(const VideoFormatDescriptor& a, const VideoFormatDescriptor& b) {
  return a.codec_name == b.codec_name && a.width == b.width && a.height == b.height &&
         std::abs(a.fps - b.fps) <= kFpsTolerance;
}

inline bool isH264(const std::string& codec) {
  std::string lower(codec);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower == "h264" || lower == "libx264" || lower == "avc1";
}

inline bool matchesTarget(const VideoFormatDescriptor& f, const config::TargetFormatConfig& target) {
  return isH264(f.codec_name) && f.width == target.width && f.height == target.height &&
         std::abs(f.fps - static_cast<double>(target.fps)) < kFpsTolerance;
}

// A file the rest of the pipeline can read. local_path exists when handed over.
struct ResolvedAsset {
  std::string source_ref;
  std::string local_path;
  uintmax_t byte_size{0};
};

enum class SegmentKind { Exercise, Break };

struct Segment {
  SegmentKind kind{SegmentKind::Exercise};
  std::string path;
  std::string label;      // exercise name or "break"
  int duration{0};        // nominal seconds
  bool degraded{false};   // trim failed, the untrimmed source is used
};

#define WORKOUT_PART_FILE_SUFFIX ".part"
#define WORKOUT_DEFAULT_VIDEO_EXT ".mov"

} // namespace workout_service
