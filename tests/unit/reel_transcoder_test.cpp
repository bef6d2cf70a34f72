#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

#include "StubServices.h"
#include "reelify/AudioExtractor.h"
#include "reelify/ReelTranscoder.h"

using namespace reelify;
using namespace reelify_test;

static void testFilterGraph() {
  assert(verticalFilter(ReelConfig{}) == "scale=1080:-2,pad=1080:1920:(ow-iw)/2:(oh-ih)/2");
  ReelConfig small;
  small.width = 720;
  small.height = 1280;
  assert(verticalFilter(small) == "scale=720:-2,pad=720:1280:(ow-iw)/2:(oh-ih)/2");
}

static void testCanvasLayout() {
  const ReelConfig cfg;
  // 607.5 rounds to the even 608
  CanvasLayout landscape = computeCanvasLayout(cv::Size(1920, 1080), cfg);
  assert(landscape.scaled == cv::Size(1080, 608));
  assert(landscape.placement == cv::Rect(0, 656, 1080, 608));
  assert(landscape.fits);

  CanvasLayout vga = computeCanvasLayout(cv::Size(640, 480), cfg);
  assert(vga.scaled == cv::Size(1080, 810));
  assert(vga.placement.y == 555);

  CanvasLayout portrait = computeCanvasLayout(cv::Size(1080, 1920), cfg);
  assert(portrait.scaled == cv::Size(1080, 1920));
  assert(portrait.placement == cv::Rect(0, 0, 1080, 1920));
  assert(portrait.fits);

  assert(!computeCanvasLayout(cv::Size(720, 1920), cfg).fits);
  assert(!computeCanvasLayout(cv::Size(0, 0), cfg).fits);
}

static void testMissingInputSkipsService() {
  const fs::path dir = scratchDir("reel_missing");
  StubMediaService media;
  ReelTranscoder transcoder(media, nullptr, ReelConfig{});
  std::ostringstream log;
  MediaAsset out;
  const Status st = transcoder.toVertical((dir / "absent.mp4").string(),
                                          (dir / "vertical_output.mp4").string(), out, log);
  assert(!st.ok());
  assert(st.kind() == ErrorKind::Transform);
  assert(st.message().find("No such file") != std::string::npos);
  assert(media.requests.empty());
}

static void testServiceFailureCarriesDiagnostics() {
  const fs::path dir = scratchDir("reel_fail");
  touch(dir / "in.mkv");
  const std::string output = (dir / "vertical_output.mp4").string();
  StubMediaService media;
  media.failures[output] = "in.mkv: Invalid data found when processing input";
  ReelTranscoder transcoder(media, nullptr, ReelConfig{});
  std::ostringstream log;
  MediaAsset out;
  const Status st = transcoder.toVertical((dir / "in.mkv").string(), output, out, log);
  assert(st.kind() == ErrorKind::Transform);
  assert(st.message() == "in.mkv: Invalid data found when processing input");
}

static void testSuccessfulTranscode() {
  const fs::path dir = scratchDir("reel_ok");
  touch(dir / "in.mp4");
  const std::string output = (dir / "vertical_output.mp4").string();
  touch(output, "stale");

  StubMediaService media;
  StubProbe probe;
  probe.info.frame_size = cv::Size(1920, 1080);
  probe.info.duration_seconds = 95.0;
  ReelTranscoder transcoder(media, &probe, ReelConfig{});
  std::ostringstream log;
  MediaAsset out;
  const Status st = transcoder.toVertical((dir / "in.mp4").string(), output, out, log);
  assert(st.ok());
  assert(media.requests.size() == 1);
  assert(media.requests[0].option("vf") == verticalFilter(ReelConfig{}));
  assert(media.requests[0].output_path == output);
  assert(slurp(output) != "stale");
  assert(out.path == output);
  assert(out.kind == AssetKind::VerticalVideo);
  assert(out.duration_seconds && *out.duration_seconds == 95.0);
  assert(probe.calls == 2);
  assert(log.str().find("Scaled=1080x608") != std::string::npos);
}

static void testAudioExtraction() {
  const fs::path dir = scratchDir("reel_audio");
  StubMediaService media;
  const std::string wav = (dir / "audio.wav").string();
  media.failures[wav] = "Output file #0 does not contain any stream";
  AudioExtractor extractor(media);
  std::ostringstream log;
  const Status bad = extractor.extract((dir / "in.mp4").string(), wav, log);
  assert(bad.kind() == ErrorKind::Transform);
  assert(bad.message() == "Output file #0 does not contain any stream");

  const Status good = extractor.extract((dir / "in.mp4").string(), (dir / "audio.mp3").string(), log);
  assert(good.ok());
  assert(media.requests.back().option("map") == "a");
  assert(media.requests.back().option("q:a") == "0");
}

int main() {
  testFilterGraph();
  testCanvasLayout();
  testMissingInputSkipsService();
  testServiceFailureCarriesDiagnostics();
  testSuccessfulTranscode();
  testAudioExtraction();
  std::cout << "[Test] reel_transcoder_test passed" << std::endl;
  return 0;
}
