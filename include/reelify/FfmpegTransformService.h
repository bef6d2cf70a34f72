// Reelify - FfmpegTransformService
// MediaTransformService backed by the ffmpeg command line tool.

#pragma once

#include <ostream>
#include <string>

#include "reelify/Config.h"
#include "reelify/MediaTransformService.h"

namespace reelify {

class FfmpegTransformService : public MediaTransformService {
public:
  explicit FfmpegTransformService(FfmpegConfig cfg);

  TransformResult transform(const TransformRequest& request, std::ostream& log) override;

  // Full command line for `request`, stderr folded into stdout.
  std::string buildCommand(const TransformRequest& request) const;

private:
  FfmpegConfig cfg_;
};

} // namespace reelify
