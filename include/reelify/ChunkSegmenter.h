// Reelify - ChunkSegmenter
// Split the vertical video into fixed-duration, stream-copied chunks.

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "reelify/Config.h"
#include "reelify/MediaAsset.h"
#include "reelify/MediaProbe.h"
#include "reelify/MediaTransformService.h"
#include "reelify/Status.h"
#include "reelify/Workspace.h"

namespace reelify {

struct ChunkSpan {
  double start_seconds = 0.0;
  double duration_seconds = 0.0;
};

// Spans a segmenter cutting every `segment_seconds` yields for a video of
// `duration_seconds`: ceil(D / segment) gapless spans, the last one shorter.
std::vector<ChunkSpan> planChunks(double duration_seconds, int segment_seconds);

class ChunkSegmenter {
public:
  // `probe` may be null; the expected chunk count is then not logged.
  ChunkSegmenter(MediaTransformService& media,
                 const WorkspaceManager& workspace,
                 MediaProbe* probe,
                 SegmentConfig cfg);

  // Replaces the chunk set in the workspace with a fresh split of
  // `vertical_path`. On success `chunks` holds the new files in time order.
  Status split(const std::string& vertical_path,
               std::vector<MediaAsset>& chunks,
               std::ostream& log);

private:
  void clearChunks(std::ostream& log);

  MediaTransformService& media_;
  const WorkspaceManager& workspace_;
  MediaProbe* probe_;
  SegmentConfig cfg_;
};

} // namespace reelify
