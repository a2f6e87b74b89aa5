#include "libav_prober.hpp"
#include "common/logger.hpp"
#include <memory>

namespace workout_service {

namespace {
struct InputCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
}

LibavProber::LibavProber(std::chrono::seconds timeout, int loglevel) : timeout_(timeout) {
  av_log_set_level(loglevel);
}

int LibavProber::interruptCallback(void* opaque) {
  auto* deadline = static_cast<const std::chrono::steady_clock::time_point*>(opaque);
  return std::chrono::steady_clock::now() >= *deadline ? 1 : 0;
}

std::optional<VideoFormatDescriptor> LibavProber::probe(const std::string& path) {
  auto deadline = std::chrono::steady_clock::now() + timeout_;

  AVFormatContext* raw = avformat_alloc_context();
  if (!raw) {
    common::Logger::error("libav could not allocate a format context");
    return std::nullopt;
  }
  raw->interrupt_callback.callback = &LibavProber::interruptCallback;
  raw->interrupt_callback.opaque = &deadline;

  // avformat_open_input frees the context on failure
  int rc = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
  if (rc < 0) {
    if (rc == AVERROR_EXIT) {
      common::Logger::warn("libav probe of " + path + " timed out after " +
                           std::to_string(timeout_.count()) + "s");
    } else {
      common::Logger::debug("libav could not open " + path);
    }
    return std::nullopt;
  }
  std::unique_ptr<AVFormatContext, InputCloser> input(raw);

  rc = avformat_find_stream_info(input.get(), nullptr);
  if (rc < 0) {
    if (rc == AVERROR_EXIT) {
      common::Logger::warn("libav probe of " + path + " timed out after " +
                           std::to_string(timeout_.count()) + "s");
    }
    return std::nullopt;
  }
  int idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (idx < 0) {
    return std::nullopt;
  }

  AVStream* stream = input->streams[idx];
  VideoFormatDescriptor desc;
  desc.codec_name = avcodec_get_name(stream->codecpar->codec_id);
  desc.width = stream->codecpar->width;
  desc.height = stream->codecpar->height;
  desc.bitrate = stream->codecpar->bit_rate;

  AVRational rate = stream->r_frame_rate;
  if (rate.num == 0 || rate.den == 0) {
    rate = av_guess_frame_rate(input.get(), stream, nullptr);
  }
  desc.fps = (rate.num == 0 || rate.den == 0) ? 30.0 : av_q2d(rate);

  if (stream->duration != AV_NOPTS_VALUE) {
    desc.duration = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
  } else if (input->duration != AV_NOPTS_VALUE) {
    desc.duration = static_cast<double>(input->duration) / AV_TIME_BASE;
  }

  common::Logger::debug("probed " + path + ": " + desc.debug());
  return desc;
}

} // namespace workout_service
