// Reelify - HighlightTimelineExtractor
// Summarize a transcript window by window and lay the summaries out as
// evenly spaced, fixed-length highlights over an assumed video duration.

#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "reelify/Config.h"
#include "reelify/Status.h"
#include "reelify/SummarizationService.h"

namespace reelify {

struct HighlightPoint {
  int ordinal = 0;          // 1-based
  int64_t start_seconds = 0;
  int64_t end_seconds = 0;
  std::string summary;      // trimmed
};

using HighlightTimeline = std::vector<HighlightPoint>;

// HH:MM:SS, hours not wrapped.
std::string formatTimestamp(int64_t seconds);

// Consecutive slices of at most `window_chars` UTF-8 characters (code
// points); concatenated they give back `text`. Empty text yields no windows.
std::vector<std::string> splitWindows(const std::string& text, std::size_t window_chars);

// Start offsets for `count` highlights spread over `duration_seconds`:
// step = duration / (count + 1) (integer division), starts at step, 2*step, ...
std::vector<int64_t> planStartOffsets(int count, int64_t duration_seconds);

// "<n>. HH:MM:SS - HH:MM:SS: <summary>" per point, each line newline-terminated.
std::string formatTimeline(const HighlightTimeline& timeline);

class HighlightTimelineExtractor {
public:
  HighlightTimelineExtractor(SummarizationService& summarizer,
                             HighlightConfig cfg,
                             SummaryParams params);

  // Uses cfg.assumed_duration_seconds as the total duration.
  Status extract(const std::string& transcript, HighlightTimeline& timeline, std::ostream& log);

  // Fails as a whole when any window cannot be summarized; `timeline` is
  // left empty in that case.
  Status extract(const std::string& transcript,
                 int64_t total_duration_seconds,
                 HighlightTimeline& timeline,
                 std::ostream& log);

private:
  SummarizationService& summarizer_;
  HighlightConfig cfg_;
  SummaryParams params_;
};

} // namespace reelify
