#include "reelify/Workspace.h"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace reelify {

static std::string zeroPad(int64_t value, int width) {
  std::ostringstream oss;
  oss << std::setw(width) << std::setfill('0') << value;
  return oss.str();
}

static bool defaultRemove(const fs::path& p, std::error_code& ec) {
  return fs::remove(p, ec);
}

// Lists as much of `dir` as can be read; `ec` holds the first failure.
static std::vector<fs::directory_entry> defaultList(const fs::path& dir, std::error_code& ec) {
  std::vector<fs::directory_entry> children;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
  for (; !ec && it != end; it.increment(ec)) children.push_back(*it);
  return children;
}

// Numeric suffix of a chunk name, or UINT64_MAX when it is not a number.
static uint64_t chunkIndex(const std::string& name, std::size_t prefix_len, std::size_t ext_len) {
  if (name.size() < prefix_len + ext_len) return UINT64_MAX;
  const std::string digits = name.substr(prefix_len, name.size() - prefix_len - ext_len);
  if (digits.empty() || digits.size() > 18) return UINT64_MAX;
  uint64_t value = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return UINT64_MAX;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  return value;
}

WorkspaceManager::WorkspaceManager(WorkspaceConfig cfg)
    : WorkspaceManager(std::move(cfg), defaultRemove) {}

WorkspaceManager::WorkspaceManager(WorkspaceConfig cfg, RemoveFn remove_file)
    : WorkspaceManager(std::move(cfg), std::move(remove_file), defaultList) {}

WorkspaceManager::WorkspaceManager(WorkspaceConfig cfg, RemoveFn remove_file, ListFn list_dir)
    : cfg_(std::move(cfg)),
      root_(fs::path(cfg_.root).lexically_normal()),
      remove_file_(std::move(remove_file)),
      list_dir_(std::move(list_dir)) {}

void WorkspaceManager::collect(const fs::path& dir,
                               std::vector<std::pair<fs::path, bool>>& entries,
                               std::ostream& log) const {
  std::error_code ec;
  const std::vector<fs::directory_entry> children = list_dir_(dir, ec);
  if (ec) {
    // Unreadable directories are skipped; the rest of the tree is still walked.
    log << "[Workspace] Cannot list " << dir << ": " << ec.message() << "\n";
  }
  for (const fs::directory_entry& child : children) {
    std::error_code type_ec;
    const bool is_dir = child.is_directory(type_ec) && !child.is_symlink(type_ec);
    if (is_dir) collect(child.path(), entries, log);
    entries.emplace_back(child.path(), is_dir);
  }
}

Status WorkspaceManager::acquire(std::ostream& log) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec || !fs::is_directory(root_)) {
    log << "[Workspace] Failed to create directory: " << root_ << "\n";
    return Status(ErrorKind::Workspace,
                  "cannot create " + root_.string() + ": " + ec.message());
  }
  return Status::Ok();
}

CleanupReport WorkspaceManager::reset(std::ostream& log) {
  CleanupReport report;

  // Children come before their parent, so files go first.
  std::vector<std::pair<fs::path, bool>> entries;
  std::error_code ec;
  if (fs::is_directory(root_, ec)) collect(root_, entries, log);

  for (const auto& entry : entries) {
    std::error_code rm_ec;
    if (entry.second) {
      // Non-empty or locked directories are left behind silently.
      fs::remove(entry.first, rm_ec);
      continue;
    }
    remove_file_(entry.first, rm_ec);
    if (rm_ec) {
      const std::string warning = "Skipped locked file: " + entry.first.filename().string();
      log << "[Workspace] " << warning << " (" << rm_ec.message() << ")\n";
      report.warnings.push_back(warning);
    }
  }

  std::error_code root_ec;
  fs::remove(root_, root_ec);

  report.status = acquire(log);
  if (report.status.ok()) {
    log << "[Workspace] Cleaned " << root_ << " (" << report.warnings.size()
        << " warning(s))\n";
  }
  return report;
}

Status WorkspaceManager::stage(const std::string& source,
                               std::string& staged_path,
                               std::ostream& log) {
  const Status acquired = acquire(log);
  if (!acquired.ok()) return acquired;

  const fs::path src(source);
  const fs::path dst = root_ / src.filename();
  std::error_code ec;
  if (fs::exists(dst, ec) && fs::equivalent(src, dst, ec)) {
    staged_path = dst.string();
    return Status::Ok();
  }
  fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    log << "[Workspace] Failed to stage " << src << ": " << ec.message() << "\n";
    return Status(ErrorKind::Workspace, "cannot stage " + source + ": " + ec.message());
  }
  staged_path = dst.string();
  log << "[Workspace] Staged " << src.filename() << "\n";
  return Status::Ok();
}

fs::path WorkspaceManager::audioWav() const { return root_ / cfg_.audio_wav; }

fs::path WorkspaceManager::audioMp3() const { return root_ / cfg_.audio_mp3; }

fs::path WorkspaceManager::verticalVideo() const { return root_ / cfg_.vertical_video; }

fs::path WorkspaceManager::chunkPattern() const {
  return root_ / (cfg_.chunk_prefix + "%0" + std::to_string(cfg_.chunk_index_width) + "d" +
                  cfg_.chunk_extension);
}

fs::path WorkspaceManager::chunkPath(int index) const {
  return root_ / (cfg_.chunk_prefix + zeroPad(index, cfg_.chunk_index_width) +
                  cfg_.chunk_extension);
}

bool WorkspaceManager::isChunkFile(const fs::path& p) const {
  const std::string name = p.filename().string();
  const std::string& prefix = cfg_.chunk_prefix;
  const std::string& ext = cfg_.chunk_extension;
  if (name.size() <= prefix.size() + ext.size()) return false;
  if (name.compare(0, prefix.size(), prefix) != 0) return false;
  return name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

std::vector<fs::path> WorkspaceManager::listChunks() const {
  std::vector<fs::path> chunks;
  std::error_code ec;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && isChunkFile(it->path())) {
      chunks.push_back(it->path());
    }
  }
  // By index, so chunk_1000 follows chunk_999 once the padding overflows.
  const std::size_t prefix_len = cfg_.chunk_prefix.size();
  const std::size_t ext_len = cfg_.chunk_extension.size();
  std::sort(chunks.begin(), chunks.end(), [&](const fs::path& a, const fs::path& b) {
    const uint64_t ia = chunkIndex(a.filename().string(), prefix_len, ext_len);
    const uint64_t ib = chunkIndex(b.filename().string(), prefix_len, ext_len);
    if (ia != ib) return ia < ib;
    return a < b;
  });
  return chunks;
}

fs::path WorkspaceManager::transcriptPath(const std::string& audio_name) const {
  return root_ / (fs::path(audio_name).filename().string() + ".txt");
}

} // namespace reelify
