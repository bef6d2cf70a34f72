#include "reelify/Config.h"

#include <cstdlib>

namespace reelify {

static void overrideFromEnv(const char* name, std::string& target) {
  if (const char* env = std::getenv(name)) {
    if (env[0] != '\0') target = env;
  }
}

void applyEnvironment(PipelineConfig& cfg) {
  overrideFromEnv("REELIFY_WORKSPACE", cfg.workspace.root);
  overrideFromEnv("REELIFY_FFMPEG", cfg.ffmpeg.binary);
  overrideFromEnv("REELIFY_WHISPER", cfg.transcription.binary);
  overrideFromEnv("REELIFY_WHISPER_MODEL", cfg.transcription.model_path);
  overrideFromEnv("REELIFY_SUMMARIZER", cfg.summary.command);
}

} // namespace reelify
