#include "ffweave/builder/Stream.h"
#include "ffweave/encoding/FFmpeg.h"
#include "ffweave/nodes/video/Format.h"
#include "ffweave/nodes/video/Scale.h"
#include "ffweave/pipeline/Errors.h"
#include "ffweave/pipeline/FFmpegOptions.h"
#include "ffweave/process/ProcessRunner.h"

#include "test_utils.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace ffweave;

class FakeRunner final : public ProcessRunner {
public:
  ProcessResult result;
  std::vector<std::string> seen;
  int calls = 0;

  ProcessResult run(const std::vector<std::string>& argv) override {
    seen = argv;
    ++calls;
    return result;
  }
};

// in.mp4 (video + audio) -> out.mp4: scaled/formatted video, audio as is.
std::shared_ptr<Output> transcode(FFmpeg& ff) {
  InputOptions in_opt;
  in_opt.fast_seek = Timestamp::from_seconds(1.5);
  in_opt.duration = Timestamp::from_seconds(10);
  auto in = ff.add_input(input_file("in.mp4", {{StreamKind::Video, std::nullopt},
                                               {StreamKind::Audio, std::nullopt}},
                                    in_opt));

  OutputOptions out_opt;
  out_opt.format = "mp4";
  out_opt.extra = {{"movflags", "+faststart"}};
  auto out = ff.add_output(output_file("out.mp4", {nodes::VideoCodec("libx264", 3000000),
                                                   nodes::AudioCodec("aac")},
                                       out_opt));

  in->video()
      .pipe(nodes::Scale(640, -1))
      ->output()
      ->pipe(nodes::Format("yuv420p"))
      ->output()
      ->pipe(out->video());
  ffweave::connect(in->audio(), out->audio());
  return out;
}

} // namespace

int main() {
  try {
    // Full argv with global, input, per-stream and container options.
    {
      FFmpegOptions opt;
      opt.loglevel = "error";
      opt.overwrite = true;
      opt.hide_banner = true;
      opt.no_stdin = true;
      FFmpeg ff(opt);
      transcode(ff);

      const std::vector<std::string> expected{
          "ffmpeg", "-loglevel", "error", "-hide_banner", "-nostdin", "-y",
          "-ss", "1.5", "-t", "10.0", "-i", "in.mp4",
          "-map", "0:v", "-filter:v:0", "scale=w=640:h=-1,format=pix_fmts=yuv420p",
          "-c:v:0", "libx264", "-b:v:0", "3000000",
          "-map", "0:a", "-c:a:0", "aac",
          "-f", "mp4", "-movflags", "+faststart", "out.mp4"};
      require(ff.get_args() == expected, "argv mismatch: " + ff.get_cmd());
    }

    // Outputs without a kind get -vn / -an; stub codecs render no codec flags.
    {
      FFmpeg ff;
      auto in = ff.add_input(input_file("in.mp4", {{StreamKind::Audio, std::nullopt}}));
      auto out = ff.add_output(output_file("out.m4a"));
      auto stub = out->audio();
      require(stub->user_label() == "<stub>", "stub codec label");
      require(out->audio() == stub, "free stub reused");
      ffweave::connect(in->audio(), stub);
      const std::vector<std::string> expected{"ffmpeg", "-i", "in.mp4", "-map", "0:a", "-vn", "out.m4a"};
      require(ff.get_args() == expected, "audio-only argv: " + ff.get_cmd());
      require(out->audio() != stub, "connected stub is not free any more");
    }

    // Program bookkeeping.
    {
      FFmpeg ff;
      auto in = ff.add_input(input_file("in.mp4", {{StreamKind::Video, std::nullopt},
                                                   {StreamKind::Video, std::nullopt}}));
      require(in->index() == 0, "first input index");
      bool threw = false;
      try {
        ff.add_input(in);
      } catch (const std::invalid_argument&) {
        threw = true;
      }
      require(threw, "input added twice");

      require(&ff.free_source(StreamKind::Video) == &in->video(0), "first free video stream");
      in->video(0).pipe(nodes::Scale(1, 1));
      require(&ff.free_source(StreamKind::Video) == &in->video(1), "next free video stream");
      threw = false;
      try {
        (void)ff.free_source(StreamKind::Audio);
      } catch (const std::out_of_range&) {
        threw = true;
      }
      require(threw, "no audio source");

      auto codec = nodes::VideoCodec("libx264");
      auto owner = output_file("a.mp4", {codec});
      threw = false;
      try {
        (void)output_file("b.mp4", {codec});
      } catch (const std::invalid_argument&) {
        threw = true;
      }
      require(threw, "codec adopted by two outputs");
      require(codec->output() == owner.get(), "codec keeps its first output");
      require(codec->display_name() == "a.mp4:v:0", "codec display name");
    }

    // Successful run.
    {
      FFmpeg ff;
      transcode(ff);
      FakeRunner runner;
      runner.result.exit_code = 0;
      runner.result.err = "frame=  250 fps=100\n";
      const RunReport report = ff.run(runner);
      require(runner.calls == 1, "runner called once");
      require(runner.seen == ff.get_args(), "runner got the rendered argv");
      require(report.exit_code == 0, "exit code recorded");
      require(report.error_marker.empty(), "no marker");
      require(report.command_line == ff.get_cmd(), "command line recorded");
    }

    // Non-zero exit.
    {
      FFmpeg ff;
      transcode(ff);
      FakeRunner runner;
      runner.result.exit_code = 1;
      runner.result.err = "in.mp4: No such file or directory\n";
      bool threw = false;
      try {
        (void)ff.run(runner);
      } catch (const FFmpegError& e) {
        threw = true;
        require(e.report().exit_code == 1, "report exit code");
        require(e.report().error_marker == "No such file or directory", "report marker");
        require(e.report().error_lines.size() == 1, "report error lines");
        require_contains(e.report().repro_note, "Re-run with: ffmpeg", "repro note");
        require_contains(e.what(), "exit_code=1", "error message");
        const auto j = nlohmann::json::parse(e.report().to_json());
        require(j.at("exit_code").get<int>() == 1, "report json exit code");
        require(j.at("args").size() == e.report().args.size(), "report json args");
      }
      require(threw, "non-zero exit should throw");
    }

    // Zero exit with an error marker still fails.
    {
      FFmpeg ff;
      transcode(ff);
      FakeRunner runner;
      runner.result.exit_code = 0;
      runner.result.err = "frame=1\n[vost#0] Error initializing output stream\nConversion failed!\n";
      bool threw = false;
      try {
        (void)ff.run(runner);
      } catch (const FFmpegError& e) {
        threw = true;
        require(e.report().error_marker == "Error initializing", "earliest marker wins");
        require(e.report().error_lines.size() == 2, "both marker lines kept");
      }
      require(threw, "marker should fail the run");
    }

    // Process helpers.
    {
      require(find_error_marker("Invalid argument then Conversion failed!", default_error_markers()) ==
                  "Invalid argument",
              "first marker in text order");
      require(find_error_marker("all good", default_error_markers()).empty(), "no marker");
      require(tail("line1\nline2\nline3", 8) == "line3", "tail cuts at a line start");
      require(tail("short", 100) == "short", "tail keeps short text");
      require(shell_join({"ffmpeg", "-i", "my file.mp4", "it's"}) == "ffmpeg -i 'my file.mp4' 'it'\\''s'",
              "shell quoting");
      require(shell_join({"a", ""}) == "a ''", "empty argument quoted");
    }

    // Configuration from JSON and the environment.
    {
      const auto j = nlohmann::json::parse(
          R"({"binary": "/opt/ffmpeg/bin/ffmpeg", "overwrite": true, "loglevel": "warning",
              "error_markers": ["boom"], "tail_bytes": 128})");
      const FFmpegOptions opt = options_from_json(j);
      require(opt.binary == "/opt/ffmpeg/bin/ffmpeg", "json binary");
      require(opt.probe_binary == "ffprobe", "missing key keeps default");
      require(opt.overwrite && opt.loglevel == "warning", "json flags");
      require(opt.error_markers.size() == 1 && opt.error_markers[0] == "boom", "json markers");
      require(opt.tail_bytes == 128, "json tail bytes");

      for (const char* bad : {R"([1, 2])", R"({"overwrite": "yes"})", R"({"binary": ""})"}) {
        bool threw = false;
        try {
          (void)options_from_json(nlohmann::json::parse(bad));
        } catch (const std::invalid_argument&) {
          threw = true;
        }
        require(threw, std::string("options_from_json should reject ") + bad);
      }

      setenv("FFWEAVE_FFMPEG_BIN", "/usr/local/bin/ffmpeg", 1);
      setenv("FFWEAVE_TAIL_BYTES", "64", 1);
      const FFmpegOptions env = options_from_env();
      unsetenv("FFWEAVE_FFMPEG_BIN");
      unsetenv("FFWEAVE_TAIL_BYTES");
      require(env.binary == "/usr/local/bin/ffmpeg", "env binary");
      require(env.tail_bytes == 64, "env tail bytes");
      require(options_from_env().binary == "ffmpeg", "env cleared");

      FFmpegOptions custom;
      custom.binary = "/opt/ffmpeg/bin/ffmpeg";
      FFmpeg ff(custom);
      transcode(ff);
      require(ff.get_args().front() == "/opt/ffmpeg/bin/ffmpeg", "binary used as argv[0]");
    }

    std::cout << "[OK] unit_ffmpeg_run_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
