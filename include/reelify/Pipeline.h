// Reelify - Pipeline Orchestrator
// Wires workspace, transcoder, segmenter, transcriber and highlight
// extractor behind the four user-triggered actions. Services are owned by
// the caller and must outlive the pipeline.

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "reelify/Config.h"
#include "reelify/HighlightTimeline.h"
#include "reelify/MediaAsset.h"
#include "reelify/MediaProbe.h"
#include "reelify/MediaTransformService.h"
#include "reelify/Status.h"
#include "reelify/SummarizationService.h"
#include "reelify/TranscriptionService.h"
#include "reelify/Workspace.h"

namespace reelify {

struct ReelReport {
  std::string staged_path;
  Status wav_status;
  Status mp3_status;
  MediaAsset vertical;
  // Staging or vertical transcode outcome
  Status status;
};

struct AudioReport {
  std::string audio;            // file name as uploaded
  std::string detected_language;
  TranscriptDocument transcript;
  std::string transcript_path;
  Status status;                // staging, transcription, transcript write
  HighlightTimeline timeline;
  std::string formatted_timeline;
  Status highlight_status;
};

class Pipeline {
public:
  Pipeline(PipelineConfig cfg,
           WorkspaceManager& workspace,
           MediaTransformService& media,
           TranscriptionService& transcriber,
           SummarizationService& summarizer,
           MediaProbe* probe = nullptr);

  // Stages the video, extracts WAV and MP3 audio, then writes the vertical
  // rendition. Audio extraction failures do not stop the transcode.
  Status extractAndTranscode(const std::string& source_video,
                             ReelReport& report,
                             std::ostream& log);

  // Splits the vertical rendition into chunks (requires extractAndTranscode).
  Status chunk(std::vector<MediaAsset>& chunks, std::ostream& log);

  // Transcribes each file in order; one file failing does not stop the rest.
  std::vector<AudioReport> transcribe(const std::vector<std::string>& audio_files,
                                      std::ostream& log);

  // Empties the workspace.
  CleanupReport clean(std::ostream& log);

private:
  void transcribeOne(const std::string& audio_file, AudioReport& report, std::ostream& log);

  PipelineConfig cfg_;
  WorkspaceManager& workspace_;
  MediaTransformService& media_;
  TranscriptionService& transcriber_;
  SummarizationService& summarizer_;
  MediaProbe* probe_;
};

} // namespace reelify
