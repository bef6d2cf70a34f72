#include <iostream>
#include <string>
#include <vector>

#include "reelify/CommandSummarizer.h"
#include "reelify/FfmpegTransformService.h"
#include "reelify/MediaProbe.h"
#include "reelify/Pipeline.h"
#include "reelify/WhisperCliTranscriber.h"
#include "reelify/Workspace.h"

using namespace reelify;

static void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " <command> [files]\n";
  std::cerr << "  reel <video>            extract audio and convert to 1080x1920\n";
  std::cerr << "  chunk                   split the reel into 30s chunks\n";
  std::cerr << "  transcribe <audio>...   transcribe audio and list highlights\n";
  std::cerr << "  clean                   empty the workspace\n";
  std::cerr << "Workspace: $REELIFY_WORKSPACE (default ./temp)\n";
}

static void print_failure(const std::string& what, const Status& st) {
  std::cerr << what << "\n" << st.toString() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }
  const std::string command = argv[1];

  PipelineConfig cfg;
  applyEnvironment(cfg);

  WorkspaceManager workspace(cfg.workspace);
  FfmpegTransformService media(cfg.ffmpeg);
  OpenCvMediaProbe probe;
  WhisperCliTranscriber transcriber(cfg.transcription, media, workspace.root().string());
  CommandSummarizer summarizer(cfg.summary, workspace.root().string());
  Pipeline pipeline(cfg, workspace, media, transcriber, summarizer, &probe);

  const Status acquired = workspace.acquire(std::cout);
  if (!acquired.ok()) {
    print_failure("Workspace unavailable:", acquired);
    return 1;
  }

  if (command == "reel" && argc == 3) {
    ReelReport report;
    const Status st = pipeline.extractAndTranscode(argv[2], report, std::cout);
    if (!report.wav_status.ok()) print_failure("WAV extraction failed:", report.wav_status);
    if (!report.mp3_status.ok()) print_failure("MP3 extraction failed:", report.mp3_status);
    if (!st.ok()) {
      print_failure("Reel conversion failed:", st);
      return 2;
    }
    std::cout << report.vertical.path << std::endl;
    return 0;
  }

  if (command == "chunk" && argc == 2) {
    std::vector<MediaAsset> chunks;
    const Status st = pipeline.chunk(chunks, std::cout);
    if (!st.ok()) {
      print_failure("Chunking failed:", st);
      return 2;
    }
    for (const MediaAsset& c : chunks) std::cout << c.path << "\n";
    return 0;
  }

  if (command == "transcribe" && argc >= 3) {
    const std::vector<std::string> files(argv + 2, argv + argc);
    int rc = 0;
    for (const AudioReport& r : pipeline.transcribe(files, std::cout)) {
      if (!r.status.ok()) {
        print_failure("Failed to transcribe " + r.audio, r.status);
        rc = 2;
        continue;
      }
      std::cout << "Transcript: " << r.transcript_path << "\n";
      if (!r.highlight_status.ok()) {
        print_failure("Failed to extract highlight moments.", r.highlight_status);
        rc = 2;
        continue;
      }
      std::cout << "Reel-worthy moments (" << r.audio << "):\n" << r.formatted_timeline;
    }
    return rc;
  }

  if (command == "clean" && argc == 2) {
    const CleanupReport report = pipeline.clean(std::cout);
    for (const std::string& w : report.warnings) std::cerr << "Warning: " << w << "\n";
    if (!report.status.ok()) {
      print_failure("Failed to clean temp files:", report.status);
      return 2;
    }
    std::cout << "Temporary files cleaned." << std::endl;
    return 0;
  }

  print_usage(argv[0]);
  return 1;
}
