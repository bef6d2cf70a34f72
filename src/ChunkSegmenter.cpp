#include "reelify/ChunkSegmenter.h"

#include <cmath>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace reelify {

std::vector<ChunkSpan> planChunks(double duration_seconds, int segment_seconds) {
  std::vector<ChunkSpan> spans;
  if (!(duration_seconds > 0.0) || segment_seconds <= 0) return spans;

  const auto count = static_cast<int64_t>(std::ceil(duration_seconds / segment_seconds));
  spans.reserve(static_cast<size_t>(count));
  for (int64_t i = 0; i < count; ++i) {
    ChunkSpan span;
    span.start_seconds = static_cast<double>(i * segment_seconds);
    span.duration_seconds = (i + 1 < count) ? segment_seconds
                                            : duration_seconds - span.start_seconds;
    spans.push_back(span);
  }
  return spans;
}

ChunkSegmenter::ChunkSegmenter(MediaTransformService& media,
                               const WorkspaceManager& workspace,
                               MediaProbe* probe,
                               SegmentConfig cfg)
    : media_(media), workspace_(workspace), probe_(probe), cfg_(std::move(cfg)) {}

void ChunkSegmenter::clearChunks(std::ostream& log) {
  for (const fs::path& old : workspace_.listChunks()) {
    std::error_code ec;
    fs::remove(old, ec);
    if (ec) log << "[Segmenter] Could not remove " << old.filename() << ": " << ec.message() << "\n";
  }
}

Status ChunkSegmenter::split(const std::string& vertical_path,
                             std::vector<MediaAsset>& chunks,
                             std::ostream& log) {
  chunks.clear();
  std::error_code ec;
  if (!fs::exists(vertical_path, ec)) {
    log << "[Segmenter] Reel format video not found: " << vertical_path << "\n";
    return Status(ErrorKind::Precondition,
                  "Reel format video not found. Run transcoding first.");
  }

  clearChunks(log);

  if (probe_) {
    if (auto info = probe_->probe(vertical_path, log)) {
      if (info->duration_seconds) {
        log << "[Segmenter] Expecting "
            << planChunks(*info->duration_seconds, cfg_.segment_seconds).size()
            << " chunk(s)\n";
      }
    }
  }

  TransformRequest request;
  request.input_path = vertical_path;
  request.output_path = workspace_.chunkPattern().string();
  request.options = {{"f", "segment"},
                     {"segment_time", std::to_string(cfg_.segment_seconds)},
                     {"reset_timestamps", "1"}};
  if (cfg_.stream_copy) request.options.emplace_back("c", "copy");

  log << "[Segmenter] Splitting into " << cfg_.segment_seconds << "-second chunks\n";
  const TransformResult result = media_.transform(request, log);
  if (!result.ok) {
    log << "[Segmenter] Chunking failed.\n";
    return Status(ErrorKind::Transform, result.diagnostics);
  }

  for (const fs::path& p : workspace_.listChunks()) {
    chunks.push_back(MediaAsset{p.string(), AssetKind::Chunk, std::nullopt});
  }
  log << "[Segmenter] Created " << chunks.size() << " chunks.\n";
  return Status::Ok();
}

} // namespace reelify
