// Reelify - MediaTransformService
// Boundary to the transcoding engine: one input, one output, a list of options.

#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace reelify {

struct TransformRequest {
  std::string input_path;
  std::string output_path;
  // Ordered option/value pairs, e.g. {"vf", "scale=..."}, {"c", "copy"}.
  // An empty value denotes a bare flag.
  std::vector<std::pair<std::string, std::string>> options;

  // Value of the first option named `key`, or empty.
  std::string option(const std::string& key) const {
    for (const auto& kv : options) {
      if (kv.first == key) return kv.second;
    }
    return {};
  }
};

struct TransformResult {
  bool ok = false;
  // Raw diagnostic text emitted by the engine
  std::string diagnostics;
};

class MediaTransformService {
public:
  virtual ~MediaTransformService() = default;

  // Blocks until the transform completes or fails. Overwrites the output.
  virtual TransformResult transform(const TransformRequest& request, std::ostream& log) = 0;
};

} // namespace reelify
