// Reelify - TranscriptionService
// Boundary to the speech-to-text engine.

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace reelify {

struct TranscriptionResult {
  bool ok = false;
  std::string text;
  // Raw diagnostic text when `ok` is false
  std::string diagnostics;
};

class TranscriptionService {
public:
  virtual ~TranscriptionService() = default;

  // Best-guess language code from the leading window of the audio
  // (padded or truncated to `window_seconds`). std::nullopt when unknown.
  virtual std::optional<std::string> detectLanguage(const std::string& audio_path,
                                                    int window_seconds,
                                                    std::ostream& log) = 0;

  // Full transcript of `audio_path`, decoded as `language`.
  virtual TranscriptionResult transcribe(const std::string& audio_path,
                                         const std::string& language,
                                         std::ostream& log) = 0;
};

} // namespace reelify
