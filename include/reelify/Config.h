// Reelify - Configuration structs
// Defaults mirror the fixed paths and constants of the reel workflow.

#pragma once

#include <cstddef>
#include <string>

namespace reelify {

struct WorkspaceConfig {
  // Scratch directory holding every intermediate and output artifact
  std::string root = "temp";
  std::string audio_wav = "audio.wav";
  std::string audio_mp3 = "audio.mp3";
  std::string vertical_video = "vertical_output.mp4";
  // Chunks are named <prefix><zero padded index><extension>, e.g. chunk_007.mp4
  std::string chunk_prefix = "chunk_";
  std::string chunk_extension = ".mp4";
  // Indices past the padding width (chunk_1000) still list in time order
  int chunk_index_width = 3;
};

struct FfmpegConfig {
  std::string binary = "ffmpeg";
  std::string log_level = "error";
};

struct ReelConfig {
  // Target canvas for the vertical rendition
  int width = 1080;
  int height = 1920;
};

struct SegmentConfig {
  int segment_seconds = 30;
  // Stream copy, no re-encode
  bool stream_copy = true;
};

struct TranscriptionConfig {
  // whisper.cpp command line front-end
  std::string binary = "whisper-cli";
  std::string model_path = "models/ggml-tiny.bin";
  // Leading window analysed for language detection (seconds)
  int detection_window_seconds = 30;
  // Transcripts are requested in this language regardless of detection
  std::string forced_language = "en";
  bool respect_detected_language = false;
  int sample_rate = 16000;
};

struct SummaryConfig {
  // Reads the text on stdin and prints the summary on stdout
  std::string command = "reelify-summarize";
  int max_length = 100;
  int min_length = 30;
  bool do_sample = false;
};

struct HighlightConfig {
  std::size_t window_chars = 1000;
  int max_highlights = 5;
  // Assumed length of the video the highlights are laid over (seconds)
  int assumed_duration_seconds = 600;
  int highlight_seconds = 30;
};

struct PipelineConfig {
  WorkspaceConfig workspace;
  FfmpegConfig ffmpeg;
  ReelConfig reel;
  SegmentConfig segment;
  TranscriptionConfig transcription;
  SummaryConfig summary;
  HighlightConfig highlight;
};

// Applies REELIFY_* environment overrides (workspace root and tool binaries).
void applyEnvironment(PipelineConfig& cfg);

} // namespace reelify
