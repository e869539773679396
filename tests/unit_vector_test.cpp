#include "ffweave/builder/Stream.h"
#include "ffweave/encoding/FFmpeg.h"
#include "ffweave/encoding/Vector.h"
#include "ffweave/nodes/common/Trim.h"
#include "ffweave/nodes/video/Overlay.h"
#include "ffweave/nodes/video/Scale.h"
#include "ffweave/pipeline/Errors.h"

#include "test_utils.h"

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {

using namespace ffweave;

using Sizes = std::vector<std::pair<int, int>>;

std::shared_ptr<Input> av_input(const std::string& file) {
  VideoMetaArgs v;
  v.duration = Timestamp::from_seconds(10);
  v.width = 1920;
  v.height = 1080;
  v.frame_rate = 25.0;
  AudioMetaArgs a;
  a.duration = Timestamp::from_seconds(10);
  a.sample_rate = 48000;
  a.channels = 2;
  return input_file(file, {{StreamKind::Video, video_meta_data(v)}, {StreamKind::Audio, audio_meta_data(a)}});
}

std::shared_ptr<Output> video_out(const std::string& file) {
  return output_file(file, {nodes::VideoCodec("libx264")});
}

// Two h264 outputs fed from one vector of the source's video stream.
struct TwoOutputs {
  FFmpeg ff;
  std::shared_ptr<Input> src = ff.add_input(av_input("input.mp4"));
  std::shared_ptr<Output> o1 = ff.add_output(video_out("o1.mp4"));
  std::shared_ptr<Output> o2 = ff.add_output(video_out("o2.mp4"));

  StreamVector vector() const { return StreamVector(StreamKind::Video, {&src->video(), &src->video()}); }
  std::vector<std::shared_ptr<Codec>> codecs() const { return {o1->codecs()[0], o2->codecs()[0]}; }
};

} // namespace

int main() {
  try {
    // Different parameters on a shared source stream: a Split is inserted.
    {
      TwoOutputs t;
      const StreamVector scaled = t.vector().connect<Scale>(Sizes{{1920, 1080}, {1280, 720}});
      require(scaled.size() == 2, "vector length kept");
      require(&scaled.at(0) != &scaled.at(1), "two independent streams");
      require(t.src->video().filter_dest()->kind() == "Split", "split inserted upstream");
      scaled.finalize(t.codecs());

      const RenderedGraph g = t.ff.render_graph();
      require(g.text ==
                  "[0:v]split[vout0][vout1];"
                  "[vout0]scale=w=1920:h=1080[vout2];"
                  "[vout1]scale=w=1280:h=720[vout3]",
              "vector split text: " + g.text);
      require(g.map_for(*t.o1->codecs()[0]) == "[vout2]", "o1 map");
      require(g.map_for(*t.o2->codecs()[0]) == "[vout3]", "o2 map");
    }

    // Identical parameters share one filter; the shared output is split for the codecs.
    {
      TwoOutputs t;
      const StreamVector scaled = t.vector().connect<Scale>(Sizes{{1280, 720}, {1280, 720}});
      require(&scaled.at(0) == &scaled.at(1), "one shared scale output");
      require(t.src->video().filter_dest()->kind() == "Scale", "no split before the scale");
      scaled.finalize(t.codecs());

      const RenderedGraph g = t.ff.render_graph();
      require(g.text == "[0:v]scale=w=1280:h=720[vout0];[vout0]split[vout1][vout2]",
              "shared scale text: " + g.text);
    }

    // Masked-out elements pass through unchanged.
    {
      TwoOutputs t;
      const StreamVector scaled = t.vector().connect<Scale>(Sizes{{1280, 720}, {1280, 720}}, {true, false});
      require(scaled.at(1).owner()->kind() == "Split", "masked element reads a split output");
      require(scaled.at(0).owner()->kind() == "Scale", "masked-in element is scaled");
      scaled.finalize(t.codecs());

      const RenderedGraph g = t.ff.render_graph();
      require(g.text == "[0:v]split[vout0][vout1];[vout0]scale=w=1280:h=720[vout2]", "mask text: " + g.text);
      require(g.map_for(*t.o2->codecs()[0]) == "[vout1]", "pass-through map");
    }

    // Source streams go straight to the codecs.
    {
      TwoOutputs t;
      t.vector().finalize(t.codecs());
      const RenderedGraph g = t.ff.render_graph();
      require(g.text.empty(), "no filters needed");
      require(g.map_for(*t.o1->codecs()[0]) == "0:v" && g.map_for(*t.o2->codecs()[0]) == "0:v",
              "both codecs map the source");
    }

    // Length checks.
    {
      TwoOutputs t;
      const StreamVector v = t.vector();
      require_throws<VectorLengthMismatchError>(
          [&] { (void)v.connect<Scale>(Sizes{{1, 1}, {2, 2}, {3, 3}}); }, "params length");
      require_throws<VectorLengthMismatchError>([&] { (void)v.connect(nodes::Scale(1, 1), {true}); },
                                                "mask length");
      require_throws<VectorLengthMismatchError>([&] { v.finalize({t.o1->codecs()[0]}); }, "codecs length");
      require(!t.src->video().connected(), "failed calls leave the graph untouched");
    }

    // One filter instance for streams of different sources is cloned per source.
    {
      FFmpeg ff;
      auto a = ff.add_input(av_input("a.mp4"));
      auto b = ff.add_input(av_input("b.mp4"));
      auto oa = ff.add_output(video_out("oa.mp4"));
      auto ob = ff.add_output(video_out("ob.mp4"));
      auto scale = nodes::Scale(640, 360);
      StreamVector v(StreamKind::Video, {&a->video(), &b->video()});
      const StreamVector scaled = v.connect(scale);
      require(a->video().filter_dest() == scale.get(), "instance serves the first source");
      require(b->video().filter_dest() != scale.get(), "copy serves the second source");
      require(scaled.at(1).owner()->user_label() == "scale=w=640:h=360", "copy keeps parameters");
      scaled.finalize({oa->codecs()[0], ob->codecs()[0]});
      require(ff.render_graph().text ==
                  "[0:v]scale=w=640:h=360[vout0];[1:v]scale=w=640:h=360[vout1]",
              "cloned scales");
    }

    // Cloning a filter with a bound input splits that input.
    {
      FFmpeg ff;
      auto a = ff.add_input(av_input("a.mp4"));
      auto b = ff.add_input(av_input("b.mp4"));
      auto logo = ff.add_input(av_input("logo.png"));
      auto oa = ff.add_output(video_out("oa.mp4"));
      auto ob = ff.add_output(video_out("ob.mp4"));

      auto ov = nodes::Overlay(10, 10);
      ffweave::connect(logo->video(), ov, Overlay::kTop);
      StreamVector v(StreamKind::Video, {&a->video(), &b->video()});
      const StreamVector marked = v.connect(ov);
      require(logo->video().filter_dest()->kind() == "Split", "logo split for the copies");
      require(ov->input(Overlay::kTop)->owner() == logo->video().filter_dest(), "instance reads a split output");
      require(ov->input(Overlay::kBottom) == &a->video(), "instance overlays the first source");
      marked.finalize({oa->codecs()[0], ob->codecs()[0]});

      const std::string text = ff.render_graph().text;
      require_contains(text, "[2:v]split[vout0][vout1]", "logo split statement");
      require_contains(text, "[0:v][vout0]overlay=x=10:y=10", "first overlay");
      require_contains(text, "[1:v][vout1]overlay=x=10:y=10", "second overlay");
    }

    // clone_filter on its own.
    {
      auto in = av_input("in.mp4");
      auto trim = in->video().pipe(nodes::Trim(StreamKind::Video, Timestamp(), Timestamp::from_seconds(5)));
      const auto copies = clone_filter(trim, 3);
      require(copies.size() == 3 && copies[0] == trim, "first element is the filter itself");
      require(in->video().filter_dest()->kind() == "Split", "input split");
      require(copies[2]->input(0)->owner() == in->video().filter_dest(), "copies read the split");
      require(copies[2]->output()->meta()->duration == Timestamp::from_seconds(5), "copy metadata");
      require(clone_filter(trim, 1).size() == 1, "count 1 returns the filter itself");
    }

    // SIMD: one source, several outputs.
    {
      auto src = av_input("source.mp4");
      auto o1 = output_file("1080.mp4", {nodes::VideoCodec("libx264"), nodes::AudioCodec("aac")});
      auto o2 = output_file("720.mp4", {nodes::VideoCodec("libx264"), nodes::AudioCodec("aac")});
      SIMD simd(src, {o1, o2});
      simd.finalize(simd.video().connect<Scale>(Sizes{{1920, 1080}, {1280, 720}}));

      FFmpeg& ff = simd.ffmpeg();
      require(&simd.ffmpeg() == &ff, "program built once");
      require(ff.outputs().size() == 2, "outputs added once");
      require(ff.render_graph().text ==
                  "[0:v]split[vout0][vout1];"
                  "[vout0]scale=w=1920:h=1080[vout2];"
                  "[vout1]scale=w=1280:h=720[vout3]",
              "simd graph");

      std::size_t audio_maps = 0;
      const auto args = ff.get_args();
      for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "-map" && args[i + 1] == "0:a") ++audio_maps;
      }
      require(audio_maps == 2, "audio codecs read the source directly");

      require_throws<std::invalid_argument>([] { SIMD bad(av_input("x.mp4"), {output_file("empty.mp4")}); },
                                            "outputs need codecs");
    }

    std::cout << "[OK] unit_vector_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
