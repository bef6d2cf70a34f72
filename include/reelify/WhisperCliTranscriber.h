// Reelify - WhisperCliTranscriber
// TranscriptionService that runs the whisper.cpp command line front-end.
// Audio that is not already WAV is converted to 16 kHz mono PCM first.

#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "reelify/Config.h"
#include "reelify/MediaTransformService.h"
#include "reelify/TranscriptionService.h"

namespace reelify {

class WhisperCliTranscriber : public TranscriptionService {
public:
  // Converted audio and engine logs are written under `scratch_dir`.
  WhisperCliTranscriber(TranscriptionConfig cfg, MediaTransformService& media,
                        std::string scratch_dir);

  std::optional<std::string> detectLanguage(const std::string& audio_path,
                                            int window_seconds,
                                            std::ostream& log) override;

  TranscriptionResult transcribe(const std::string& audio_path,
                                 const std::string& language,
                                 std::ostream& log) override;

  // Language code from whisper's "auto-detected language: xx" line.
  static std::optional<std::string> parseDetectedLanguage(const std::string& output);

private:
  // Path whisper can read directly; converts into a temp file when needed.
  bool prepareAudio(const std::string& audio_path,
                    std::string& wav_path,
                    bool& is_temp,
                    std::string& error,
                    std::ostream& log);

  TranscriptionConfig cfg_;
  MediaTransformService& media_;
  std::string scratch_dir_;
};

} // namespace reelify
