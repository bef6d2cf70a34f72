#include "reelify/WhisperCliTranscriber.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <utility>

#include "reelify/Process.h"

namespace fs = std::filesystem;

namespace reelify {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

// Joins whisper's per-segment lines the way the engine's own text output does.
std::string joinSegments(const std::string& output) {
  std::string text;
  size_t pos = 0;
  while (pos < output.size()) {
    size_t end = output.find('\n', pos);
    if (end == std::string::npos) end = output.size();
    std::string line = output.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!trim(line).empty()) text += line;
    pos = end + 1;
  }
  return text;
}

} // namespace

WhisperCliTranscriber::WhisperCliTranscriber(TranscriptionConfig cfg,
                                             MediaTransformService& media,
                                             std::string scratch_dir)
    : cfg_(std::move(cfg)), media_(media), scratch_dir_(std::move(scratch_dir)) {}

std::optional<std::string> WhisperCliTranscriber::parseDetectedLanguage(const std::string& output) {
  static const std::regex re(R"(auto-detected language:\s*([A-Za-z_-]+))");
  std::smatch m;
  if (std::regex_search(output, m, re)) return m[1].str();
  return std::nullopt;
}

bool WhisperCliTranscriber::prepareAudio(const std::string& audio_path,
                                         std::string& wav_path,
                                         bool& is_temp,
                                         std::string& error,
                                         std::ostream& log) {
  is_temp = false;
  std::error_code ec;
  if (!fs::exists(audio_path, ec)) {
    error = audio_path + ": No such file or directory";
    return false;
  }
  if (lower(fs::path(audio_path).extension().string()) == ".wav") {
    wav_path = audio_path;
    return true;
  }

  const fs::path tmp = fs::path(scratch_dir_) /
                       (fs::path(audio_path).stem().string() + "_16k.wav");
  TransformRequest request;
  request.input_path = audio_path;
  request.output_path = tmp.string();
  request.options = {{"ar", std::to_string(cfg_.sample_rate)},
                     {"ac", "1"},
                     {"c:a", "pcm_s16le"}};
  log << "[Transcriber] Converting " << fs::path(audio_path).filename() << " to WAV\n";
  const TransformResult result = media_.transform(request, log);
  if (!result.ok) {
    error = result.diagnostics;
    return false;
  }
  wav_path = tmp.string();
  is_temp = true;
  return true;
}

std::optional<std::string> WhisperCliTranscriber::detectLanguage(const std::string& audio_path,
                                                                 int window_seconds,
                                                                 std::ostream& log) {
  std::string wav, error;
  bool is_temp = false;
  if (!prepareAudio(audio_path, wav, is_temp, error, log)) {
    log << "[Transcriber] Language detection skipped: " << error << "\n";
    return std::nullopt;
  }

  const std::string cmd = cfg_.binary + " -m " + quote(cfg_.model_path) +
                          " -f " + quote(wav) +
                          " -l auto --detect-language" +
                          " -d " + std::to_string(window_seconds * 1000) + " 2>&1";
  log << "[Transcriber] Running: " << cmd << "\n";
  std::string output;
  const int ret = runCommand(cmd, output);
  if (is_temp) {
    std::error_code ec;
    fs::remove(wav, ec);
  }
  if (ret != 0) {
    log << "[Transcriber] Language detection returned non-zero: " << ret << "\n";
    return std::nullopt;
  }
  return parseDetectedLanguage(output);
}

TranscriptionResult WhisperCliTranscriber::transcribe(const std::string& audio_path,
                                                      const std::string& language,
                                                      std::ostream& log) {
  TranscriptionResult result;
  std::string wav;
  bool is_temp = false;
  if (!prepareAudio(audio_path, wav, is_temp, result.diagnostics, log)) {
    return result;
  }

  // Transcript on stdout, engine chatter discarded unless the run fails.
  const fs::path err_log = fs::path(scratch_dir_) /
                           (fs::path(audio_path).stem().string() + "_whisper.log");
  const std::string cmd = cfg_.binary + " -m " + quote(cfg_.model_path) +
                          " -f " + quote(wav) +
                          " -l " + quote(language) +
                          " -nt 2>" + quote(err_log.string());
  log << "[Transcriber] Running: " << cmd << "\n";
  std::string output;
  const int ret = runCommand(cmd, output);
  if (is_temp) {
    std::error_code ec;
    fs::remove(wav, ec);
  }

  if (ret != 0) {
    std::string diag = trim(readFile(err_log.string()));
    if (diag.empty()) diag = cfg_.binary + " exited with code " + std::to_string(ret);
    std::error_code ec;
    fs::remove(err_log, ec);
    log << "[Transcriber] Transcription returned non-zero: " << ret << "\n";
    result.diagnostics = diag;
    return result;
  }
  std::error_code ec;
  fs::remove(err_log, ec);

  result.text = joinSegments(output);
  result.ok = true;
  return result;
}

} // namespace reelify
