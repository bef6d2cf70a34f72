// Reelify - Media and transcript records

#pragma once

#include <optional>
#include <string>

namespace reelify {

enum class AssetKind { SourceVideo, VerticalVideo, Audio, Chunk };

struct MediaAsset {
  std::string path;
  AssetKind kind = AssetKind::SourceVideo;
  // Unknown until probed
  std::optional<double> duration_seconds;
};

struct TranscriptDocument {
  std::string text;
  std::string language;   // detected language code, empty when unknown
  std::string source;     // audio file name the transcript came from
};

} // namespace reelify
