// Reelify - MediaProbe
// Reads frame geometry and duration of a produced video.

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <opencv2/core.hpp>

namespace reelify {

struct VideoInfo {
  cv::Size frame_size;
  double fps = 0.0;
  int64_t frame_count = 0;
  // frame_count / fps, unknown when the container does not report both
  std::optional<double> duration_seconds;
};

class MediaProbe {
public:
  virtual ~MediaProbe() = default;

  // Returns std::nullopt when the file cannot be opened as a video.
  virtual std::optional<VideoInfo> probe(const std::string& path, std::ostream& log) = 0;
};

// MediaProbe using OpenCV VideoCapture.
class OpenCvMediaProbe : public MediaProbe {
public:
  std::optional<VideoInfo> probe(const std::string& path, std::ostream& log) override;
};

} // namespace reelify
