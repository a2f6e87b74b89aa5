#pragma once
#include <expected>
#include <string>

namespace workout_service {

enum class ErrorKind {
  AssetUnavailable,  // resolver could not produce a local file
  ProbeFailed,       // format inspection inconclusive, callers re-encode
  EncodeFailed,      // an encoder subprocess exited non-zero or crashed
  StreamTimeout,     // the encoder produced no output within its window
  JobNotFound,       // unknown or expired workout id
  InvalidRequest,
  Cancelled,         // the consumer went away
  Internal
};

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::AssetUnavailable: return "AssetUnavailable";
    case ErrorKind::ProbeFailed: return "ProbeFailed";
    case ErrorKind::EncodeFailed: return "EncodeFailed";
    case ErrorKind::StreamTimeout: return "StreamTimeout";
    case ErrorKind::JobNotFound: return "JobNotFound";
    case ErrorKind::InvalidRequest: return "InvalidRequest";
    case ErrorKind::Cancelled: return "Cancelled";
    case ErrorKind::Internal: return "Internal";
  }
  return "Internal";
}

struct GenerationError {
  ErrorKind kind{ErrorKind::Internal};
  std::string message;
  std::string diagnostics;  // stderr excerpt of the failing subprocess, if any

  std::string describe() const {
    std::string out = std::string(toString(kind)) + ": " + message;
    if (!diagnostics.empty()) {
      out += " [" + diagnostics + "]";
    }
    return out;
  }
};

template <typename T>
using Result = std::expected<T, GenerationError>;

inline std::unexpected<GenerationError> makeError(ErrorKind kind, std::string message,
                                                  std::string diagnostics = {}) {
  return std::unexpected(GenerationError{kind, std::move(message), std::move(diagnostics)});
}

} // namespace workout_service
