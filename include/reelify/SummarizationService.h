// Reelify - SummarizationService
// Boundary to the text summarization model.

#pragma once

#include <ostream>
#include <string>

namespace reelify {

struct SummaryParams {
  int max_length = 100;
  int min_length = 30;
  bool do_sample = false;
};

struct SummaryResult {
  bool ok = false;
  std::string summary;
  // Raw diagnostic text when `ok` is false
  std::string diagnostics;
};

class SummarizationService {
public:
  virtual ~SummarizationService() = default;

  virtual SummaryResult summarize(const std::string& text,
                                  const SummaryParams& params,
                                  std::ostream& log) = 0;
};

} // namespace reelify
