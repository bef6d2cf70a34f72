// Reelify - AudioExtractor
// Pull the audio track of a source video into the workspace.

#pragma once

#include <ostream>
#include <string>

#include "reelify/MediaTransformService.h"
#include "reelify/Status.h"

namespace reelify {

class AudioExtractor {
public:
  explicit AudioExtractor(MediaTransformService& media);

  // Writes the first audio stream of `input_path` to `output_path`; the
  // container/codec follows the output extension (.wav, .mp3).
  Status extract(const std::string& input_path,
                 const std::string& output_path,
                 std::ostream& log);

private:
  MediaTransformService& media_;
};

} // namespace reelify
