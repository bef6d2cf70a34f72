#include "reelify/AudioExtractor.h"

#include <filesystem>

namespace reelify {

AudioExtractor::AudioExtractor(MediaTransformService& media) : media_(media) {}

Status AudioExtractor::extract(const std::string& input_path,
                               const std::string& output_path,
                               std::ostream& log) {
  TransformRequest request;
  request.input_path = input_path;
  request.output_path = output_path;
  request.options = {{"q:a", "0"}, {"map", "a"}};

  const std::string name = std::filesystem::path(output_path).filename().string();
  log << "[Audio] Extracting audio (" << name << ")\n";
  const TransformResult result = media_.transform(request, log);
  if (!result.ok) {
    log << "[Audio] Extraction failed: " << name << "\n";
    return Status(ErrorKind::Transform, result.diagnostics);
  }
  log << "[Audio] Audio extracted: " << name << "\n";
  return Status::Ok();
}

} // namespace reelify
