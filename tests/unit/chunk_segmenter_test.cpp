#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "StubServices.h"
#include "reelify/ChunkSegmenter.h"

using namespace reelify;
using namespace reelify_test;

static WorkspaceConfig configFor(const fs::path& root) {
  WorkspaceConfig cfg;
  cfg.root = root.string();
  return cfg;
}

static void testPlanChunks() {
  const auto spans = planChunks(95.0, 30);
  assert(spans.size() == 4);
  assert(spans[0].start_seconds == 0.0 && spans[0].duration_seconds == 30.0);
  assert(spans[3].start_seconds == 90.0 && spans[3].duration_seconds == 5.0);

  const auto exact = planChunks(90.0, 30);
  assert(exact.size() == 3);
  assert(exact.back().duration_seconds == 30.0);

  const auto short_clip = planChunks(12.5, 30);
  assert(short_clip.size() == 1 && short_clip[0].duration_seconds == 12.5);

  const auto long_clip = planChunks(301.0, 30);
  assert(long_clip.size() == 11);
  double total = 0.0;
  for (size_t i = 0; i < long_clip.size(); ++i) {
    assert(long_clip[i].start_seconds == total);
    assert(long_clip[i].duration_seconds <= 30.0);
    total += long_clip[i].duration_seconds;
  }
  assert(total == 301.0);

  assert(planChunks(0.0, 30).empty());
}

static void testSplitBeforeTranscodeFails() {
  const fs::path root = scratchDir("seg_precondition");
  WorkspaceManager ws(configFor(root));
  StubMediaService media;
  ChunkSegmenter segmenter(media, ws, nullptr, SegmentConfig{});
  std::ostringstream log;
  std::vector<MediaAsset> chunks;
  const Status st = segmenter.split(ws.verticalVideo().string(), chunks, log);
  assert(st.kind() == ErrorKind::Precondition);
  assert(st.message().find("Run transcoding first") != std::string::npos);
  assert(media.requests.empty());
  assert(chunks.empty());
  assert(ws.listChunks().empty());
}

static void testSplitRequestAndOrdering() {
  const fs::path root = scratchDir("seg_order");
  WorkspaceManager ws(configFor(root));
  touch(ws.verticalVideo());
  StubMediaService media;
  media.segments = 12;
  StubProbe probe;
  probe.info.duration_seconds = 341.0;
  ChunkSegmenter segmenter(media, ws, &probe, SegmentConfig{});
  std::ostringstream log;
  std::vector<MediaAsset> chunks;
  assert(segmenter.split(ws.verticalVideo().string(), chunks, log).ok());

  assert(media.requests.size() == 1);
  const TransformRequest& req = media.requests[0];
  assert(req.input_path == ws.verticalVideo().string());
  assert(req.output_path == ws.chunkPattern().string());
  assert(req.option("f") == "segment");
  assert(req.option("segment_time") == "30");
  assert(req.option("c") == "copy");

  assert(chunks.size() == 12);
  for (int i = 0; i < 12; ++i) {
    assert(chunks[static_cast<size_t>(i)].path == ws.chunkPath(i).string());
    assert(chunks[static_cast<size_t>(i)].kind == AssetKind::Chunk);
  }
  assert(log.str().find("Expecting 12 chunk(s)") != std::string::npos);
}

static void testRerunRemovesStaleChunks() {
  const fs::path root = scratchDir("seg_rerun");
  WorkspaceManager ws(configFor(root));
  touch(ws.verticalVideo());
  for (int i = 0; i < 10; ++i) touch(ws.chunkPath(i), "old");

  StubMediaService media;
  media.segments = 3;
  ChunkSegmenter segmenter(media, ws, nullptr, SegmentConfig{});
  std::ostringstream log;
  std::vector<MediaAsset> chunks;
  assert(segmenter.split(ws.verticalVideo().string(), chunks, log).ok());
  assert(chunks.size() == 3);
  assert(ws.listChunks().size() == 3);
  for (const MediaAsset& c : chunks) assert(slurp(c.path) == "x");
  assert(fs::exists(ws.verticalVideo()));
}

static void testFailureLeavesNoChunks() {
  const fs::path root = scratchDir("seg_fail");
  WorkspaceManager ws(configFor(root));
  touch(ws.verticalVideo());
  for (int i = 0; i < 4; ++i) touch(ws.chunkPath(i), "old");

  StubMediaService media;
  media.failures[ws.chunkPattern().string()] = "Could not write header for output file";
  ChunkSegmenter segmenter(media, ws, nullptr, SegmentConfig{});
  std::ostringstream log;
  std::vector<MediaAsset> chunks;
  const Status st = segmenter.split(ws.verticalVideo().string(), chunks, log);
  assert(st.kind() == ErrorKind::Transform);
  assert(st.message() == "Could not write header for output file");
  assert(chunks.empty());
  assert(ws.listChunks().empty());
}

static void testReencodeWhenCopyDisabled() {
  const fs::path root = scratchDir("seg_reencode");
  WorkspaceManager ws(configFor(root));
  touch(ws.verticalVideo());
  StubMediaService media;
  SegmentConfig cfg;
  cfg.stream_copy = false;
  cfg.segment_seconds = 15;
  ChunkSegmenter segmenter(media, ws, nullptr, cfg);
  std::ostringstream log;
  std::vector<MediaAsset> chunks;
  assert(segmenter.split(ws.verticalVideo().string(), chunks, log).ok());
  assert(media.requests[0].option("c").empty());
  assert(media.requests[0].option("segment_time") == "15");
}

int main() {
  testPlanChunks();
  testSplitBeforeTranscodeFails();
  testSplitRequestAndOrdering();
  testRerunRemovesStaleChunks();
  testFailureLeavesNoChunks();
  testReencodeWhenCopyDisabled();
  std::cout << "[Test] chunk_segmenter_test passed" << std::endl;
  return 0;
}
