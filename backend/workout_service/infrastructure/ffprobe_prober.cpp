#include "ffprobe_prober.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>

namespace workout_service {

FfprobeProber::FfprobeProber(std::shared_ptr<ProcessRunner> runner,
                             std::shared_ptr<const FfmpegCommands> commands,
                             std::chrono::seconds timeout)
  : runner_(std::move(runner)), commands_(std::move(commands)), timeout_(timeout) {}

double FfprobeProber::parseFrameRate(const std::string& rate) {
  constexpr double kDefaultFps = 30.0;
  auto slash = rate.find('/');
  if (slash == std::string::npos) {
    char* end = nullptr;
    double value = std::strtod(rate.c_str(), &end);
    return end != rate.c_str() && value > 0 ? value : kDefaultFps;
  }
  double num = std::strtod(rate.substr(0, slash).c_str(), nullptr);
  double den = std::strtod(rate.substr(slash + 1).c_str(), nullptr);
  if (den == 0.0) {
    return kDefaultFps;
  }
  return num / den;
}

std::optional<VideoFormatDescriptor> FfprobeProber::parseProbeOutput(const std::string& json_text) {
  auto doc = nlohmann::json::parse(json_text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return std::nullopt;
  }
  auto streams = doc.find("streams");
  if (streams == doc.end() || !streams->is_array() || streams->empty()) {
    return std::nullopt;
  }
  const auto& s = streams->front();
  if (!s.is_object()) {
    return std::nullopt;
  }

  // ffprobe prints bit_rate and duration as strings.
  auto numberField = [&s](const char* key) -> double {
    auto it = s.find(key);
    if (it == s.end()) return 0.0;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) return std::strtod(it->get<std::string>().c_str(), nullptr);
    return 0.0;
  };

  VideoFormatDescriptor desc;
  try {
    desc.codec_name = s.value("codec_name", std::string());
    desc.width = s.value("width", 0);
    desc.height = s.value("height", 0);
    desc.fps = parseFrameRate(s.value("r_frame_rate", std::string("30/1")));
  } catch (const nlohmann::json::exception& e) {
    common::Logger::debug(std::string("unexpected probe output: ") + e.what());
    return std::nullopt;
  }
  desc.bitrate = static_cast<int64_t>(numberField("bit_rate"));
  desc.duration = numberField("duration");
  return desc;
}

std::optional<VideoFormatDescriptor> FfprobeProber::probe(const std::string& path) {
  auto result = runner_->run(commands_->probe(path), timeout_);
  if (!result) {
    common::Logger::warn("probe could not start for " + path + ": " + result.error());
    return std::nullopt;
  }
  if (!result->ok()) {
    common::Logger::debug("probe failed for " + path + (result->timed_out ? " (timeout)" : ""));
    return std::nullopt;
  }
  auto desc = parseProbeOutput(result->stdout_data);
  if (desc) {
    common::Logger::debug("probed " + path + ": " + desc->debug());
  }
  return desc;
}

} // namespace workout_service
