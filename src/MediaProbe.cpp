#include "reelify/MediaProbe.h"

#include <cmath>
#include <opencv2/videoio.hpp>

namespace reelify {

std::optional<VideoInfo> OpenCvMediaProbe::probe(const std::string& path, std::ostream& log) {
  cv::VideoCapture cap(path);
  if (!cap.isOpened()) {
    log << "[Probe] Failed to open video: " << path << "\n";
    return std::nullopt;
  }

  VideoInfo info;
  info.frame_size = cv::Size(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                             static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));
  info.fps = cap.get(cv::CAP_PROP_FPS);
  const double frames = cap.get(cv::CAP_PROP_FRAME_COUNT);
  info.frame_count = frames > 0.0 ? static_cast<int64_t>(std::llround(frames)) : 0;
  if (info.fps > 0.0 && info.frame_count > 0) {
    info.duration_seconds = static_cast<double>(info.frame_count) / info.fps;
  }

  log << "[Probe] " << path << ": " << info.frame_size.width << "x" << info.frame_size.height
      << ", FPS=" << info.fps << ", frames=" << info.frame_count << "\n";
  return info;
}

} // namespace reelify
