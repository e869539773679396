#include "ffweave/builder/Stream.h"
#include "ffweave/encoding/Codec.h"
#include "ffweave/encoding/Input.h"
#include "ffweave/nodes/common/Concat.h"
#include "ffweave/nodes/common/Split.h"
#include "ffweave/nodes/video/Overlay.h"
#include "ffweave/nodes/video/Scale.h"
#include "ffweave/pipeline/Errors.h"

#include "test_utils.h"

#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

using namespace ffweave;

std::shared_ptr<Input> av_input(const std::string& file) {
  return input_file(file, {{StreamKind::Video, std::nullopt}, {StreamKind::Audio, std::nullopt}});
}

template <class E, class F>
bool throws(F&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  try {
    // A source stream feeds one filter.
    {
      auto in = av_input("in.mp4");
      auto scale = in->video().pipe(nodes::Scale(1280, 720));
      require(in->video().filter_dest() == scale.get(), "filter_dest should be the scale");
      require(scale->input(0) == &in->video(), "scale input not bound");
      require(throws<ConnectionError>([&] { in->video().pipe(nodes::Scale(640, 360)); }),
              "second filter on one stream must fail");
    }

    // Codecs are terminal: several may read one source stream.
    {
      auto in = av_input("in.mp4");
      auto c1 = nodes::AudioCodec("aac");
      auto c2 = nodes::AudioCodec("libopus");
      ffweave::connect(in->audio(), c1);
      ffweave::connect(in->audio(), c2);
      require(in->audio().dests().size() == 2, "both codecs should read the audio stream");
      require(throws<ConnectionError>([&] { ffweave::connect(in->audio(), c1); }),
              "same codec twice must fail");

      // A filter may still be added next to the codecs.
      in->audio().pipe(nodes::Split(StreamKind::Audio, 2));
      require(in->audio().filter_dest() != nullptr, "filter next to codecs");
    }

    // Filter outputs feed exactly one destination, codecs included.
    {
      auto in = av_input("in.mp4");
      auto scale = in->video().pipe(nodes::Scale(1280, 720));
      scale->output()->pipe(nodes::VideoCodec("libx264"));
      require(throws<ConnectionError>([&] { scale->output()->pipe(nodes::VideoCodec("libx265")); }),
              "filter output reused");
    }

    // Slots: kind checks, occupancy, range.
    {
      auto a = av_input("a.mp4");
      auto b = av_input("b.mp4");
      auto scale = a->video().pipe(nodes::Scale(1280, 720));
      require(throws<NoFreeSlotError>([&] { ffweave::pipe(b->video(), scale); }),
              "pipe into a bound node should raise NoFreeSlotError");
      require(throws<NoFreeSlotError>([&] { ffweave::pipe(b->audio(), nodes::Scale(1, 1)); }),
              "audio into scale should raise NoFreeSlotError");
      require(throws<ConnectionError>([&] { ffweave::connect(b->audio(), nodes::Scale(1, 1), 0); }),
              "explicit slot with wrong kind");

      auto ov = nodes::Overlay(10, 10);
      require(throws<ConnectionError>([&] { ffweave::connect(b->video(), ov, 5); }),
              "slot out of range");
      ffweave::connect(b->video(), ov, Overlay::kTop);
      require(ov->input(Overlay::kTop) == &b->video(), "top slot bound");
      require(ov->first_free_slot() == std::optional<std::size_t>(0), "bottom slot free");
      require(!ov->inputs_bound(), "overlay not fully bound");

      auto c = av_input("c.mp4");
      require(throws<ConnectionError>([&] { ffweave::connect(c->video(), a); }),
              "sources have no inputs");
      require(throws<ConnectionError>([&] { ffweave::connect(c->video(), nullptr); }),
              "null destination");
    }

    // Concat takes one kind only.
    {
      auto in = av_input("in.mp4");
      auto concat = nodes::Concat(StreamKind::Video, 2);
      require(throws<IncompatibleStreamsError>([&] { ffweave::pipe(in->audio(), concat); }),
              "audio into video concat via pipe");
      require(throws<IncompatibleStreamsError>([&] { ffweave::connect(in->audio(), concat, 1); }),
              "audio into video concat via connect");
      require(throws<GraphError>([&] { ffweave::connect(in->audio(), concat, 1); }),
              "IncompatibleStreamsError is a GraphError");
    }

    // Split insertion keeps the existing reader on output 0.
    {
      auto in = av_input("in.mp4");
      auto scale = in->video().pipe(nodes::Scale(1280, 720));
      auto split = SplitInserter::insert(in->video(), 3);
      require(in->video().filter_dest() == split.get(), "split reads the source");
      require(scale->input(0) == split->output(0).get(), "reader moved to split output 0");
      require(!split->output(1)->connected() && !split->output(2)->connected(), "other outputs free");
      require(split->render() == "split=3", "split render");
      split->output(1)->pipe(nodes::Scale(640, 360));
      require(split->output(1)->connected(), "free output usable");
    }

    // Without metadata every downstream meta stays unknown.
    {
      auto in = av_input("in.mp4");
      auto scale = in->video().pipe(nodes::Scale(1280, 720));
      require(!scale->output()->meta().has_value(), "meta should be unknown");
      require(in->video().describe() == "Input#0:v", "stream description");
    }

    std::cout << "[OK] unit_connect_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
