#include "reelify/Pipeline.h"

#include <filesystem>
#include <fstream>
#include <utility>

#include "reelify/AudioExtractor.h"
#include "reelify/ChunkSegmenter.h"
#include "reelify/ReelTranscoder.h"

namespace fs = std::filesystem;

namespace reelify {

Pipeline::Pipeline(PipelineConfig cfg,
                   WorkspaceManager& workspace,
                   MediaTransformService& media,
                   TranscriptionService& transcriber,
                   SummarizationService& summarizer,
                   MediaProbe* probe)
    : cfg_(std::move(cfg)),
      workspace_(workspace),
      media_(media),
      transcriber_(transcriber),
      summarizer_(summarizer),
      probe_(probe) {}

Status Pipeline::extractAndTranscode(const std::string& source_video,
                                     ReelReport& report,
                                     std::ostream& log) {
  report = ReelReport{};
  report.status = workspace_.stage(source_video, report.staged_path, log);
  if (!report.status.ok()) {
    log << "[Pipeline] Staging failed: " << report.status.toString() << "\n";
    return report.status;
  }

  AudioExtractor audio(media_);
  report.wav_status = audio.extract(report.staged_path, workspace_.audioWav().string(), log);
  report.mp3_status = audio.extract(report.staged_path, workspace_.audioMp3().string(), log);

  ReelTranscoder transcoder(media_, probe_, cfg_.reel);
  report.status = transcoder.toVertical(report.staged_path, workspace_.verticalVideo().string(),
                                        report.vertical, log);
  if (!report.status.ok()) {
    log << "[Pipeline] Transcode step failed.\n";
  }
  return report.status;
}

Status Pipeline::chunk(std::vector<MediaAsset>& chunks, std::ostream& log) {
  const Status acquired = workspace_.acquire(log);
  if (!acquired.ok()) return acquired;

  ChunkSegmenter segmenter(media_, workspace_, probe_, cfg_.segment);
  const Status st = segmenter.split(workspace_.verticalVideo().string(), chunks, log);
  if (!st.ok()) log << "[Pipeline] Chunk step failed.\n";
  return st;
}

std::vector<AudioReport> Pipeline::transcribe(const std::vector<std::string>& audio_files,
                                              std::ostream& log) {
  std::vector<AudioReport> reports;
  reports.reserve(audio_files.size());
  for (const std::string& file : audio_files) {
    AudioReport report;
    transcribeOne(file, report, log);
    reports.push_back(std::move(report));
  }
  return reports;
}

void Pipeline::transcribeOne(const std::string& audio_file,
                             AudioReport& report,
                             std::ostream& log) {
  report.audio = fs::path(audio_file).filename().string();

  std::string staged;
  report.status = workspace_.stage(audio_file, staged, log);
  if (!report.status.ok()) {
    log << "[Pipeline] Failed to transcribe " << report.audio << "\n";
    return;
  }

  log << "[Transcriber] Transcribing " << report.audio << "\n";
  const auto detected = transcriber_.detectLanguage(
      staged, cfg_.transcription.detection_window_seconds, log);
  report.detected_language = detected.value_or("");
  log << "[Transcriber] Detected language: "
      << (detected ? *detected : std::string("unknown")) << "\n";

  // Forced language unless explicitly configured otherwise.
  std::string language = cfg_.transcription.forced_language;
  if (cfg_.transcription.respect_detected_language && detected) language = *detected;

  const TranscriptionResult tr = transcriber_.transcribe(staged, language, log);
  if (!tr.ok) {
    report.status = Status(ErrorKind::Transcription, tr.diagnostics);
    log << "[Pipeline] Failed to transcribe " << report.audio << "\n";
    return;
  }
  report.transcript = TranscriptDocument{tr.text, report.detected_language, report.audio};

  const fs::path txt = workspace_.transcriptPath(report.audio);
  {
    std::ofstream out(txt, std::ios::binary | std::ios::trunc);
    if (out) out << tr.text;
    if (!out) {
      report.status = Status(ErrorKind::Workspace, "cannot write " + txt.string());
      log << "[Pipeline] Failed to save transcript: " << txt << "\n";
      return;
    }
  }
  report.transcript_path = txt.string();
  log << "[Transcriber] Transcript for " << report.audio << " generated.\n";

  SummaryParams params;
  params.max_length = cfg_.summary.max_length;
  params.min_length = cfg_.summary.min_length;
  params.do_sample = cfg_.summary.do_sample;
  HighlightTimelineExtractor extractor(summarizer_, cfg_.highlight, params);
  report.highlight_status = extractor.extract(tr.text, report.timeline, log);
  if (!report.highlight_status.ok()) {
    log << "[Pipeline] Failed to extract highlight moments.\n";
    return;
  }
  report.formatted_timeline = formatTimeline(report.timeline);
}

CleanupReport Pipeline::clean(std::ostream& log) {
  return workspace_.reset(log);
}

} // namespace reelify
