// Reelify - ReelTranscoder
// Scale-and-pad a source video onto the vertical reel canvas.

#pragma once

#include <ostream>
#include <string>
#include <opencv2/core.hpp>

#include "reelify/Config.h"
#include "reelify/MediaAsset.h"
#include "reelify/MediaProbe.h"
#include "reelify/MediaTransformService.h"
#include "reelify/Status.h"

namespace reelify {

struct CanvasLayout {
  cv::Size scaled;    // source scaled to the canvas width
  cv::Rect placement; // where the scaled frame lands on the canvas
  bool fits = true;   // false when the scaled frame is taller than the canvas
};

// Geometry the filter produces for a `source` frame: width forced to the
// canvas width, height kept in proportion and rounded to the nearest even
// value, then centered on the canvas.
CanvasLayout computeCanvasLayout(const cv::Size& source, const ReelConfig& cfg);

// ffmpeg filter graph for the transform, e.g.
// scale=1080:-2,pad=1080:1920:(ow-iw)/2:(oh-ih)/2
std::string verticalFilter(const ReelConfig& cfg);

class ReelTranscoder {
public:
  // `probe` may be null; the output duration then stays unknown.
  ReelTranscoder(MediaTransformService& media, MediaProbe* probe, ReelConfig cfg);

  // Writes the vertical rendition of `input_path` to `output_path`,
  // replacing any earlier one.
  Status toVertical(const std::string& input_path,
                    const std::string& output_path,
                    MediaAsset& output,
                    std::ostream& log);

private:
  MediaTransformService& media_;
  MediaProbe* probe_;
  ReelConfig cfg_;
};

} // namespace reelify
