#include "ffweave/analysis/Probe.h"
#include "ffweave/builder/Stream.h"
#include "ffweave/encoding/Input.h"

#include "test_utils.h"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace ffweave;

const char* kProbeJson = R"({
  "streams": [
    {
      "index": 0, "codec_type": "video", "width": 1920, "height": 1080,
      "sample_aspect_ratio": "1:1", "display_aspect_ratio": "16:9",
      "r_frame_rate": "30000/1001", "avg_frame_rate": "30000/1001",
      "start_time": "0.000000", "duration": "10.010000", "bit_rate": "5000000", "nb_frames": "300"
    },
    {
      "index": 1, "codec_type": "audio", "sample_rate": "48000", "channels": 2,
      "start_time": "0.000000", "duration": "10.000000", "bit_rate": "128000"
    },
    {"index": 2, "codec_type": "data"}
  ],
  "format": {"duration": "10.010000"}
})";

class FakeRunner final : public ProcessRunner {
public:
  ProcessResult result;
  std::vector<std::string> seen;
  bool fail_spawn = false;

  ProcessResult run(const std::vector<std::string>& argv) override {
    seen = argv;
    if (fail_spawn) throw std::runtime_error("spawn failed");
    return result;
  }
};

bool close_to(double a, double b) {
  return std::fabs(a - b) < 1e-6;
}

} // namespace

int main() {
  try {
    // Stream metadata from an ffprobe document.
    {
      const auto specs = parse_ffprobe_output(kProbeJson);
      require(specs.size() == 2, "data stream skipped");
      require(specs[0].kind == StreamKind::Video && specs[1].kind == StreamKind::Audio, "kinds in file order");

      const Meta& v = *specs[0].meta;
      require(v.width == 1920 && v.height == 1080, "video size");
      require(close_to(v.par, 1.0), "par");
      require(close_to(v.dar, 1.778), "dar rounded to 3 digits");
      require(close_to(v.frame_rate, 30000.0 / 1001.0), "frame rate");
      require(v.frames == 300, "frame count");
      require(v.bitrate == 5000000, "video bitrate");
      require(v.duration == Timestamp::from_seconds(10.01), "video duration");

      const Meta& a = *specs[1].meta;
      require(a.sample_rate == 48000 && a.channels == 2, "audio format");
      require(a.samples == 480000, "samples derived from duration");
      require(a.bitrate == 128000, "audio bitrate");
    }

    // Missing stream duration falls back to the container.
    {
      const auto specs = parse_ffprobe_output(
          R"({"streams": [{"codec_type": "video", "width": 640, "height": 360, "r_frame_rate": "25/1"}],
              "format": {"duration": "4.0"}})");
      require(specs.size() == 1, "one stream");
      require(specs[0].meta->duration == Timestamp::from_seconds(4), "format duration used");
      require(specs[0].meta->frames == 100, "frames derived from rate");
      require(parse_ffprobe_output(R"({"format": {}})").empty(), "no streams array");
    }

    // A malformed ratio only loses that field.
    {
      const std::string doc = R"({
        "streams": [
          {"codec_type": "video", "width": 1280, "height": 720, "sample_aspect_ratio": "?",
           "display_aspect_ratio": "bogus", "r_frame_rate": "x/y", "avg_frame_rate": "25/1",
           "duration": "2.0"},
          {"codec_type": "audio", "sample_rate": "44100", "channels": 1, "duration": "2.0"}
        ]})";
      const auto specs = parse_ffprobe_output(doc);
      require(specs.size() == 2 && specs[0].meta && specs[1].meta, "both streams kept");
      const Meta& v = *specs[0].meta;
      require(close_to(v.par, 1.0), "par falls back to square pixels");
      require(close_to(v.dar, 1280.0 / 720.0), "dar derived from the frame size");
      require(close_to(v.frame_rate, 25.0), "frame rate from avg_frame_rate");
      require(specs[1].meta->sample_rate == 44100, "audio untouched");

      FakeRunner runner;
      runner.result.exit_code = 0;
      runner.result.out = doc;
      require(probe("odd.mp4", runner).size() == 2, "probe keeps the file");
    }

    // Rationals.
    {
      require(close_to(parse_rational("16:9"), 16.0 / 9.0), "colon form");
      require(close_to(parse_rational("30000/1001"), 30000.0 / 1001.0), "slash form");
      require(close_to(parse_rational("1.5"), 1.5), "plain number");
      require(parse_rational("1/0") == 0.0, "zero denominator");
      require(parse_rational("") == 0.0, "empty");
      require_throws<std::invalid_argument>([] { (void)parse_rational("abc"); }, "malformed rational");
      require_throws<std::invalid_argument>([] { (void)parse_ffprobe_output("not json"); },
                                            "malformed ffprobe output");
    }

    // Running ffprobe through a runner.
    {
      FFmpegOptions opt;
      opt.probe_binary = "/opt/ffmpeg/bin/ffprobe";
      FakeRunner runner;
      runner.result.exit_code = 0;
      runner.result.out = kProbeJson;

      const auto specs = probe("in.mp4", runner, opt);
      require(runner.seen == probe_args("in.mp4", opt), "probe argv");
      require(runner.seen.front() == "/opt/ffmpeg/bin/ffprobe" && runner.seen.back() == "in.mp4",
              "binary and file");
      require(specs.size() == 2, "probed streams");

      auto in = input_file("in.mp4", specs);
      require(in->video().meta()->scenes.front().stream == "in.mp4#0", "video stream id");
      require(in->audio().meta()->scenes.front().stream == "in.mp4#1", "audio stream id");

      runner.result.exit_code = 1;
      runner.result.err = "in.mp4: No such file or directory";
      require(probe("in.mp4", runner).empty(), "failed probe is empty");

      runner.result.exit_code = 0;
      runner.result.out = "garbage";
      require(probe("in.mp4", runner).empty(), "bad output is empty");

      runner.fail_spawn = true;
      require(probe("in.mp4", runner).empty(), "spawn failure is empty");
    }

    std::cout << "[OK] unit_probe_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
