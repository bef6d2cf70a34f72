#include "reelify/FfmpegTransformService.h"

#include <utility>

#include "reelify/Process.h"

namespace reelify {

FfmpegTransformService::FfmpegTransformService(FfmpegConfig cfg) : cfg_(std::move(cfg)) {}

std::string FfmpegTransformService::buildCommand(const TransformRequest& request) const {
  std::string cmd = cfg_.binary + " -y -hide_banner";
  if (!cfg_.log_level.empty()) cmd += " -loglevel " + cfg_.log_level;
  cmd += " -i " + quote(request.input_path);
  for (const auto& kv : request.options) {
    cmd += " -" + kv.first;
    if (!kv.second.empty()) cmd += " " + quote(kv.second);
  }
  cmd += " " + quote(request.output_path) + " 2>&1";
  return cmd;
}

TransformResult FfmpegTransformService::transform(const TransformRequest& request,
                                                  std::ostream& log) {
  TransformResult result;
  const std::string cmd = buildCommand(request);
  log << "[Ffmpeg] Running: " << cmd << "\n";

  const int ret = runCommand(cmd, result.diagnostics);
  if (ret != 0) {
    log << "[Ffmpeg] ffmpeg returned non-zero: " << ret << "\n";
    if (result.diagnostics.empty()) {
      result.diagnostics = ret == -1 ? "failed to start " + cfg_.binary
                                     : cfg_.binary + " exited with code " + std::to_string(ret);
    }
    return result;
  }
  result.ok = true;
  return result;
}

} // namespace reelify
