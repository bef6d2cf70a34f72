// Reelify - CommandSummarizer
// SummarizationService that pipes each text window through an external
// command and reads the summary from its stdout. Stderr is kept apart and
// only reported when the command fails.

#pragma once

#include <ostream>
#include <string>

#include "reelify/Config.h"
#include "reelify/SummarizationService.h"

namespace reelify {

class CommandSummarizer : public SummarizationService {
public:
  // Window and stderr files are written under `scratch_dir`.
  CommandSummarizer(SummaryConfig cfg, std::string scratch_dir);

  SummaryResult summarize(const std::string& text,
                          const SummaryParams& params,
                          std::ostream& log) override;

  // Command line for a window stored at `input_file`, stderr to `error_file`.
  std::string buildCommand(const std::string& input_file,
                           const std::string& error_file,
                           const SummaryParams& params) const;

private:
  SummaryConfig cfg_;
  std::string scratch_dir_;
};

} // namespace reelify
