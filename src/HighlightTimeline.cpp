#include "reelify/HighlightTimeline.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace reelify {

static std::string trimmed(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n\f\v");
  return s.substr(first, last - first + 1);
}

std::string formatTimestamp(int64_t seconds) {
  const int64_t h = seconds / 3600;
  const int64_t m = (seconds % 3600) / 60;
  const int64_t s = seconds % 60;
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << h << ':' << std::setw(2) << m << ':'
      << std::setw(2) << s;
  return oss.str();
}

std::vector<std::string> splitWindows(const std::string& text, std::size_t window_chars) {
  std::vector<std::string> windows;
  if (window_chars == 0) return windows;

  // Windows count UTF-8 code points; continuation bytes stay with their lead.
  std::size_t begin = 0;
  while (begin < text.size()) {
    std::size_t end = begin;
    std::size_t chars = 0;
    while (end < text.size()) {
      const auto c = static_cast<unsigned char>(text[end]);
      if ((c & 0xC0) != 0x80) {
        if (chars == window_chars) break;
        ++chars;
      }
      ++end;
    }
    windows.push_back(text.substr(begin, end - begin));
    begin = end;
  }
  return windows;
}

std::vector<int64_t> planStartOffsets(int count, int64_t duration_seconds) {
  std::vector<int64_t> starts;
  if (count <= 0) return starts;
  const int64_t step = duration_seconds / (count + 1);
  int64_t start = step;
  for (int i = 0; i < count; ++i) {
    starts.push_back(start);
    start += step;
  }
  return starts;
}

std::string formatTimeline(const HighlightTimeline& timeline) {
  std::ostringstream oss;
  for (const HighlightPoint& p : timeline) {
    oss << p.ordinal << ". " << formatTimestamp(p.start_seconds) << " - "
        << formatTimestamp(p.end_seconds) << ": " << p.summary << "\n";
  }
  return oss.str();
}

HighlightTimelineExtractor::HighlightTimelineExtractor(SummarizationService& summarizer,
                                                       HighlightConfig cfg,
                                                       SummaryParams params)
    : summarizer_(summarizer), cfg_(std::move(cfg)), params_(params) {}

Status HighlightTimelineExtractor::extract(const std::string& transcript,
                                           HighlightTimeline& timeline,
                                           std::ostream& log) {
  return extract(transcript, cfg_.assumed_duration_seconds, timeline, log);
}

Status HighlightTimelineExtractor::extract(const std::string& transcript,
                                           int64_t total_duration_seconds,
                                           HighlightTimeline& timeline,
                                           std::ostream& log) {
  timeline.clear();
  const std::vector<std::string> windows = splitWindows(transcript, cfg_.window_chars);
  if (windows.empty()) {
    log << "[Highlights] Empty transcript, no highlights.\n";
    return Status::Ok();
  }
  if (total_duration_seconds < 0) {
    return Status(ErrorKind::Highlight, "negative total duration");
  }

  // Every window is summarized, even those past the highlight cap.
  std::vector<std::string> summaries;
  summaries.reserve(windows.size());
  for (std::size_t i = 0; i < windows.size(); ++i) {
    const SummaryResult r = summarizer_.summarize(windows[i], params_, log);
    if (!r.ok) {
      log << "[Highlights] Summarization failed for window " << (i + 1) << "/"
          << windows.size() << "\n";
      return Status(ErrorKind::Highlight, r.diagnostics);
    }
    summaries.push_back(r.summary);
  }

  const int total = std::min(cfg_.max_highlights, static_cast<int>(summaries.size()));
  const std::vector<int64_t> starts = planStartOffsets(total, total_duration_seconds);

  HighlightTimeline out;
  out.reserve(static_cast<std::size_t>(total));
  for (int i = 0; i < total; ++i) {
    HighlightPoint p;
    p.ordinal = i + 1;
    p.start_seconds = starts[static_cast<std::size_t>(i)];
    p.end_seconds = p.start_seconds + cfg_.highlight_seconds;
    p.summary = trimmed(summaries[static_cast<std::size_t>(i)]);
    out.push_back(std::move(p));
  }

  log << "[Highlights] " << windows.size() << " window(s), " << out.size()
      << " highlight(s)\n";
  timeline = std::move(out);
  return Status::Ok();
}

} // namespace reelify
