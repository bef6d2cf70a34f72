#include "reelify/CommandSummarizer.h"

#include <filesystem>
#include <fstream>
#include <utility>

#include "reelify/Process.h"

namespace fs = std::filesystem;

namespace reelify {

CommandSummarizer::CommandSummarizer(SummaryConfig cfg, std::string scratch_dir)
    : cfg_(std::move(cfg)), scratch_dir_(std::move(scratch_dir)) {}

std::string CommandSummarizer::buildCommand(const std::string& input_file,
                                            const std::string& error_file,
                                            const SummaryParams& params) const {
  std::string cmd = cfg_.command +
                    " --max-length " + std::to_string(params.max_length) +
                    " --min-length " + std::to_string(params.min_length);
  if (params.do_sample) cmd += " --sample";
  cmd += " < " + quote(input_file) + " 2> " + quote(error_file);
  return cmd;
}

SummaryResult CommandSummarizer::summarize(const std::string& text,
                                           const SummaryParams& params,
                                           std::ostream& log) {
  SummaryResult result;
  std::error_code ec;
  const fs::path input = fs::path(scratch_dir_) / "summary_window.txt";
  const fs::path errors = fs::path(scratch_dir_) / "summary_window.err";
  {
    std::ofstream out(input, std::ios::binary);
    if (!out) {
      result.diagnostics = "cannot write summarizer input: " + input.string();
      return result;
    }
    out << text;
  }

  const std::string cmd = buildCommand(input.string(), errors.string(), params);
  log << "[Summarizer] Running: " << cmd << "\n";
  std::string output;
  const int ret = runCommand(cmd, output);
  const std::string stderr_text = readFile(errors.string());
  fs::remove(input, ec);
  fs::remove(errors, ec);

  if (ret != 0) {
    log << "[Summarizer] Summarizer returned non-zero: " << ret << "\n";
    if (!stderr_text.empty()) {
      result.diagnostics = stderr_text;
    } else if (!output.empty()) {
      result.diagnostics = output;
    } else {
      result.diagnostics = cfg_.command + " exited with code " + std::to_string(ret);
    }
    return result;
  }
  if (!stderr_text.empty()) {
    log << "[Summarizer] stderr: " << stderr_text << (stderr_text.back() == '\n' ? "" : "\n");
  }
  result.summary = output;
  result.ok = true;
  return result;
}

} // namespace reelify
