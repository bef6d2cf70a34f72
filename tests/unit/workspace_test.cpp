#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "StubServices.h"
#include "reelify/Workspace.h"

using namespace reelify;
using namespace reelify_test;

static WorkspaceConfig configFor(const fs::path& root) {
  WorkspaceConfig cfg;
  cfg.root = root.string();
  return cfg;
}

static void testFixedPaths() {
  const fs::path root = scratchDir("ws_paths");
  WorkspaceManager ws(configFor(root));
  assert(ws.audioWav() == root / "audio.wav");
  assert(ws.audioMp3() == root / "audio.mp3");
  assert(ws.verticalVideo() == root / "vertical_output.mp4");
  assert(ws.chunkPattern() == root / "chunk_%03d.mp4");
  assert(ws.chunkPath(7) == root / "chunk_007.mp4");
  assert(ws.transcriptPath("talk.mp3") == root / "talk.mp3.txt");
  assert(ws.isChunkFile("chunk_001.mp4"));
  assert(!ws.isChunkFile("chunk_.mp4"));
  assert(!ws.isChunkFile("vertical_output.mp4"));
}

static void testChunksListInTimeOrder() {
  const fs::path root = scratchDir("ws_chunks");
  WorkspaceManager ws(configFor(root));
  for (int i = 11; i >= 0; --i) touch(ws.chunkPath(i));
  touch(root / "notes.txt");
  const auto chunks = ws.listChunks();
  assert(chunks.size() == 12);
  for (int i = 0; i < 12; ++i) assert(chunks[static_cast<size_t>(i)] == ws.chunkPath(i));
}

static void testChunksPastPaddingWidth() {
  const fs::path root = scratchDir("ws_chunks_wide");
  WorkspaceManager ws(configFor(root));
  for (int i : {1000, 100, 999, 101, 0, 1001}) touch(ws.chunkPath(i));
  const auto chunks = ws.listChunks();
  assert(chunks.size() == 6);
  assert(chunks[0].filename() == "chunk_000.mp4");
  assert(chunks[1].filename() == "chunk_100.mp4");
  assert(chunks[2].filename() == "chunk_101.mp4");
  assert(chunks[3].filename() == "chunk_999.mp4");
  assert(chunks[4].filename() == "chunk_1000.mp4");
  assert(chunks[5].filename() == "chunk_1001.mp4");
}

static void testResetEmptiesTree() {
  const fs::path root = scratchDir("ws_reset");
  WorkspaceManager ws(configFor(root));
  fs::create_directories(root / "a" / "b");
  touch(root / "top.mp4");
  touch(root / "a" / "mid.wav");
  touch(root / "a" / "b" / "deep.txt");

  std::ostringstream log;
  const CleanupReport report = ws.reset(log);
  assert(report.status.ok());
  assert(report.warnings.empty());
  assert(fs::is_directory(root));
  assert(fs::is_empty(root));
}

static void testResetSkipsLockedFile() {
  const fs::path root = scratchDir("ws_locked");
  WorkspaceManager ws(configFor(root),
                     [](const fs::path& p, std::error_code& ec) {
                       if (p.filename() == "locked.bin") {
                         ec = std::make_error_code(std::errc::permission_denied);
                         return false;
                       }
                       return fs::remove(p, ec);
                     });
  fs::create_directories(root / "sub");
  touch(root / "sub" / "locked.bin");
  touch(root / "sub" / "free.bin");
  touch(root / "other.mp4");

  std::ostringstream log;
  const CleanupReport report = ws.reset(log);
  assert(report.status.ok());
  assert(report.warnings.size() == 1);
  assert(report.warnings[0] == "Skipped locked file: locked.bin");
  assert(log.str().find("Skipped locked file: locked.bin") != std::string::npos);
  assert(fs::is_directory(root));
  assert(!fs::exists(root / "other.mp4"));
  assert(!fs::exists(root / "sub" / "free.bin"));
}

static void testResetContinuesPastUnreadableDirectory() {
  const fs::path root = scratchDir("ws_unreadable");
  fs::create_directories(root / "a");
  fs::create_directories(root / "b" / "c");
  touch(root / "a" / "inner.txt");
  touch(root / "b" / "c" / "deep.txt");
  touch(root / "z.mp4");

  // "a" cannot be listed; everything else must still go.
  WorkspaceManager ws(configFor(root),
                     [](const fs::path& p, std::error_code& ec) { return fs::remove(p, ec); },
                     [](const fs::path& dir, std::error_code& ec) {
                       std::vector<fs::directory_entry> children;
                       if (dir.filename() == "a") {
                         ec = std::make_error_code(std::errc::permission_denied);
                         return children;
                       }
                       for (const auto& e : fs::directory_iterator(dir)) children.push_back(e);
                       return children;
                     });

  std::ostringstream log;
  const CleanupReport report = ws.reset(log);
  assert(report.status.ok());
  assert(report.warnings.empty());
  assert(log.str().find("Cannot list") != std::string::npos);
  assert(fs::is_directory(root));
  assert(!fs::exists(root / "z.mp4"));
  assert(!fs::exists(root / "b"));
  // The unlisted directory is left as it was
  assert(fs::exists(root / "a" / "inner.txt"));
}

static void testResetCreatesMissingRoot() {
  const fs::path root = scratchDir("ws_missing") / "nested" / "temp";
  WorkspaceManager ws(configFor(root));
  std::ostringstream log;
  const CleanupReport report = ws.reset(log);
  assert(report.status.ok());
  assert(fs::is_directory(root));
  // Idempotent
  assert(ws.reset(log).status.ok());
  assert(ws.acquire(log).ok());
}

static void testResetReportsUncreatableRoot() {
  const fs::path base = scratchDir("ws_blocked");
  touch(base / "file");
  WorkspaceManager ws(configFor(base / "file" / "temp"));
  std::ostringstream log;
  const CleanupReport report = ws.reset(log);
  assert(!report.status.ok());
  assert(report.status.kind() == ErrorKind::Workspace);
}

static void testStageCopiesInput() {
  const fs::path base = scratchDir("ws_stage");
  touch(base / "clip.mov", "frames");
  WorkspaceManager ws(configFor(base / "temp"));
  std::ostringstream log;
  std::string staged;
  assert(ws.stage((base / "clip.mov").string(), staged, log).ok());
  assert(fs::path(staged) == base / "temp" / "clip.mov");
  assert(slurp(staged) == "frames");

  // Staging a file already in the workspace is a no-op
  std::string again;
  assert(ws.stage(staged, again, log).ok());
  assert(again == staged);

  std::string missing;
  const Status st = ws.stage((base / "nope.mov").string(), missing, log);
  assert(!st.ok() && st.kind() == ErrorKind::Workspace);
}

int main() {
  testFixedPaths();
  testChunksListInTimeOrder();
  testChunksPastPaddingWidth();
  testResetEmptiesTree();
  testResetSkipsLockedFile();
  testResetContinuesPastUnreadableDirectory();
  testResetCreatesMissingRoot();
  testResetReportsUncreatableRoot();
  testStageCopiesInput();
  std::cout << "[Test] workspace_test passed" << std::endl;
  return 0;
}
