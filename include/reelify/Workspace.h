// Reelify - WorkspaceManager
// Owns the scratch directory and the fixed artifact paths inside it.

#pragma once

#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "reelify/Config.h"
#include "reelify/Status.h"

namespace reelify {

struct CleanupReport {
  // Set only when the root itself could not be recreated
  Status status;
  // One entry per file that could not be removed
  std::vector<std::string> warnings;
};

class WorkspaceManager {
public:
  using RemoveFn = std::function<bool(const std::filesystem::path&, std::error_code&)>;
  using ListFn = std::function<std::vector<std::filesystem::directory_entry>(
      const std::filesystem::path&, std::error_code&)>;

  explicit WorkspaceManager(WorkspaceConfig cfg);
  // `remove_file` replaces std::filesystem::remove for regular files.
  WorkspaceManager(WorkspaceConfig cfg, RemoveFn remove_file);
  // `list_dir` replaces directory listing during reset.
  WorkspaceManager(WorkspaceConfig cfg, RemoveFn remove_file, ListFn list_dir);

  // Creates the root if missing. Safe to call repeatedly.
  Status acquire(std::ostream& log);

  // Deletes everything below the root and recreates it empty. Files that
  // cannot be removed are skipped and reported as warnings; directories
  // that cannot be listed or removed are skipped silently.
  CleanupReport reset(std::ostream& log);

  // Copies `source` into the workspace under its own file name.
  Status stage(const std::string& source, std::string& staged_path, std::ostream& log);

  std::filesystem::path root() const { return root_; }
  std::filesystem::path audioWav() const;
  std::filesystem::path audioMp3() const;
  std::filesystem::path verticalVideo() const;
  // printf-style pattern understood by the segment muxer, e.g. chunk_%03d.mp4
  std::filesystem::path chunkPattern() const;
  std::filesystem::path chunkPath(int index) const;
  bool isChunkFile(const std::filesystem::path& p) const;
  // Existing chunk files in temporal order (by numeric suffix).
  std::vector<std::filesystem::path> listChunks() const;
  std::filesystem::path transcriptPath(const std::string& audio_name) const;

private:
  void collect(const std::filesystem::path& dir,
               std::vector<std::pair<std::filesystem::path, bool>>& entries,
               std::ostream& log) const;

  WorkspaceConfig cfg_;
  std::filesystem::path root_;
  RemoveFn remove_file_;
  ListFn list_dir_;
};

} // namespace reelify
