#include "ffmpeg_commands.hpp"
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace workout_service {

namespace {
std::string formatNumber(double value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

void append(std::vector<std::string>& args, std::initializer_list<std::string> more) {
  args.insert(args.end(), more.begin(), more.end());
}

std::string quoteForConcat(const std::string& path) {
  std::string out = "'";
  for (char c : path) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}
}

FfmpegCommands::FfmpegCommands(config::EncoderConfig encoder) : encoder_(std::move(encoder)) {}

std::vector<std::string> FfmpegCommands::ffmpegPrefix() const {
  return {encoder_.ffmpeg_path, "-hide_banner", "-loglevel", "error"};
}

std::vector<std::string> FfmpegCommands::encodeArgs() const {
  const auto& t = encoder_.target;
  return {"-c:v", t.codec_lib, "-preset", t.preset, "-crf", std::to_string(t.crf),
          "-pix_fmt", t.pix_fmt, "-an"};
}

std::string FfmpegCommands::scaleFilter() const {
  return "scale=" + std::to_string(encoder_.target.width) + ":" + std::to_string(encoder_.target.height);
}

CommandSpec FfmpegCommands::probe(const std::string& path) const {
  return {{encoder_.ffprobe_path, "-v", "quiet", "-print_format", "json", "-show_streams",
           "-select_streams", "v:0", path},
          OutputMode::Pipe};
}

CommandSpec FfmpegCommands::breakClip(const std::string& image, int duration, const std::string& output) const {
  const auto& t = encoder_.target;
  auto args = ffmpegPrefix();
  append(args, {"-loop", "1", "-i", image, "-t", std::to_string(duration), "-vf", scaleFilter(),
                "-c:v", t.codec_lib, "-preset", t.preset, "-r", std::to_string(t.fps),
                "-pix_fmt", t.pix_fmt, "-an", "-f", "mp4", "-y", output});
  return {args, OutputMode::Discard};
}

CommandSpec FfmpegCommands::trim(const std::string& input, int duration, const std::string& output,
                                 double speed_multiplier) const {
  auto args = ffmpegPrefix();
  append(args, {"-i", input, "-t", std::to_string(duration)});
  if (speed_multiplier != 1.0) {
    append(args, {"-filter:v", "setpts=" + formatNumber(1.0 / speed_multiplier) + "*PTS"});
  }
  auto enc = encodeArgs();
  args.insert(args.end(), enc.begin(), enc.end());
  append(args, {"-r", std::to_string(encoder_.target.fps), "-f", "mp4", "-y", output});
  return {args, OutputMode::Discard};
}

CommandSpec FfmpegCommands::normalize(const std::string& input, const std::string& output) const {
  auto args = ffmpegPrefix();
  append(args, {"-i", input, "-vf", scaleFilter(), "-r", std::to_string(encoder_.target.fps)});
  auto enc = encodeArgs();
  args.insert(args.end(), enc.begin(), enc.end());
  append(args, {"-f", "mp4", "-y", output});
  return {args, OutputMode::Discard};
}

CommandSpec FfmpegCommands::concatCopy(const std::string& list_file, const std::string& output) const {
  auto args = ffmpegPrefix();
  append(args, {"-f", "concat", "-safe", "0", "-i", list_file, "-c", "copy", "-an", "-f", "mp4", "-y", output});
  return {args, OutputMode::Discard};
}

CommandSpec FfmpegCommands::concatReencode(const std::string& list_file, const std::string& output) const {
  auto args = ffmpegPrefix();
  append(args, {"-f", "concat", "-safe", "0", "-i", list_file, "-vf", scaleFilter(),
                "-r", std::to_string(encoder_.target.fps)});
  auto enc = encodeArgs();
  args.insert(args.end(), enc.begin(), enc.end());
  append(args, {"-f", "mp4", "-y", output});
  return {args, OutputMode::Discard};
}

CommandSpec FfmpegCommands::streamConcat(const std::string& list_file, double speed_multiplier) const {
  const auto& t = encoder_.target;
  auto filter = scaleFilter();
  if (speed_multiplier != 1.0) {
    filter += ",setpts=" + formatNumber(1.0 / speed_multiplier) + "*PTS";
  }
  auto args = ffmpegPrefix();
  append(args, {"-f", "concat", "-safe", "0", "-i", list_file, "-filter:v", filter,
                "-r", std::to_string(t.fps), "-c:v", t.codec_lib, "-preset", t.preset,
                "-pix_fmt", t.pix_fmt, "-movflags", "frag_keyframe+empty_moov+default_base_moof",
                "-f", "mp4", "-an", "pipe:1"});
  return {args, OutputMode::Pipe};
}

std::expected<void, std::string> FfmpegCommands::writeConcatList(const fs::path& list_file,
                                                                 const std::vector<std::string>& files) {
  std::vector<ConcatEntry> entries;
  entries.reserve(files.size());
  for (const auto& file : files) {
    entries.push_back({file, std::nullopt});
  }
  return writeConcatList(list_file, entries);
}

std::expected<void, std::string> FfmpegCommands::writeConcatList(const fs::path& list_file,
                                                                 const std::vector<ConcatEntry>& entries) {
  std::ofstream out(list_file, std::ios::trunc);
  if (!out) {
    return std::unexpected("Failed to open concat list " + list_file.string());
  }
  for (const auto& entry : entries) {
    std::error_code ec;
    auto absolute = fs::absolute(entry.path, ec);
    out << "file " << quoteForConcat(ec ? entry.path : absolute.string()) << "\n";
    if (entry.outpoint) {
      out << "outpoint " << formatNumber(*entry.outpoint) << "\n";
    }
  }
  out.flush();
  if (!out) {
    return std::unexpected("Failed to write concat list " + list_file.string());
  }
  return {};
}

} // namespace workout_service
