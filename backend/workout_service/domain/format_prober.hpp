#pragma once
#include "video.hpp"
#include <optional>
#include <string>

namespace workout_service {

class FormatProber {
public:
  virtual ~FormatProber() = default;
  // nullopt means "inconclusive": callers assume a re-encode is needed.
  virtual std::optional<VideoFormatDescriptor> probe(const std::string& path) = 0;
};

} // namespace workout_service
