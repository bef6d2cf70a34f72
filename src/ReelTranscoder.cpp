#include "reelify/ReelTranscoder.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace reelify {

CanvasLayout computeCanvasLayout(const cv::Size& source, const ReelConfig& cfg) {
  CanvasLayout layout;
  if (source.width <= 0 || source.height <= 0) {
    layout.fits = false;
    return layout;
  }
  const double exact = static_cast<double>(source.height) * cfg.width / source.width;
  const int height = std::max(2, static_cast<int>(std::lround(exact / 2.0)) * 2);
  layout.scaled = cv::Size(cfg.width, height);
  layout.fits = height <= cfg.height;
  layout.placement = cv::Rect((cfg.width - layout.scaled.width) / 2,
                              (cfg.height - layout.scaled.height) / 2,
                              layout.scaled.width, layout.scaled.height);
  return layout;
}

std::string verticalFilter(const ReelConfig& cfg) {
  const std::string w = std::to_string(cfg.width);
  const std::string h = std::to_string(cfg.height);
  return "scale=" + w + ":-2,pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2";
}

ReelTranscoder::ReelTranscoder(MediaTransformService& media, MediaProbe* probe, ReelConfig cfg)
    : media_(media), probe_(probe), cfg_(std::move(cfg)) {}

Status ReelTranscoder::toVertical(const std::string& input_path,
                                  const std::string& output_path,
                                  MediaAsset& output,
                                  std::ostream& log) {
  std::error_code ec;
  if (!fs::exists(input_path, ec)) {
    log << "[Transcoder] Input not found: " << input_path << "\n";
    return Status(ErrorKind::Transform, input_path + ": No such file or directory");
  }

  if (probe_) {
    if (auto info = probe_->probe(input_path, log)) {
      const CanvasLayout layout = computeCanvasLayout(info->frame_size, cfg_);
      log << "[Transcoder] Scaled=" << layout.scaled.width << "x" << layout.scaled.height
          << ", offset=(" << layout.placement.x << "," << layout.placement.y << ")\n";
      if (!layout.fits) {
        log << "[Transcoder] Scaled frame exceeds the " << cfg_.width << "x" << cfg_.height
            << " canvas\n";
      }
    }
  }

  TransformRequest request;
  request.input_path = input_path;
  request.output_path = output_path;
  request.options = {{"vf", verticalFilter(cfg_)}};

  log << "[Transcoder] Converting to vertical format " << cfg_.width << "x" << cfg_.height << "\n";
  const TransformResult result = media_.transform(request, log);
  if (!result.ok) {
    log << "[Transcoder] Reel conversion failed.\n";
    return Status(ErrorKind::Transform, result.diagnostics);
  }

  output = MediaAsset{output_path, AssetKind::VerticalVideo, std::nullopt};
  if (probe_) {
    if (auto info = probe_->probe(output_path, log)) output.duration_seconds = info->duration_seconds;
  }
  log << "[Transcoder] Reel format created: " << output_path << "\n";
  return Status::Ok();
}

} // namespace reelify
