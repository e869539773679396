#include "ffweave/media/Meta.h"
#include "ffweave/media/Timestamp.h"

#include "test_utils.h"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

int main() {
  try {
    using ffweave::Timestamp;

    require(Timestamp::parse("5").micros() == 5000000, "parse seconds");
    require(Timestamp::parse("5").to_string() == "5.0", "format whole seconds");
    require(Timestamp::parse("01:02.5").to_string() == "62.5", "parse mm:ss.f");
    require(Timestamp::parse("1:02:03.250").millis() == 3723250, "parse hh:mm:ss.fff");
    require(Timestamp::parse("0.000001").micros() == 1, "parse microseconds");
    require(Timestamp::from_seconds(1.25).to_string() == "1.25", "format fraction");
    require((-Timestamp::from_millis(1500)).to_string() == "-1.5", "format negative");
    require(Timestamp::parse("-2.5") == -Timestamp::from_millis(2500), "parse negative");

    for (const char* bad : {"", "abc", "1:2:3:4", "1.x", "1::2", "99999999999999999999", "999999999999:0:0"}) {
      bool threw = false;
      try {
        (void)Timestamp::parse(bad);
      } catch (const std::invalid_argument&) {
        threw = true;
      }
      require(threw, std::string("parse should reject '") + bad + "'");
    }

    const Timestamp a = Timestamp::from_seconds(2);
    const Timestamp b = Timestamp::from_seconds(5);
    require((b - a).to_string() == "3.0", "subtraction");
    require(ffweave::min_ts(a, b) == a && ffweave::max_ts(a, b) == b, "min/max");

    ffweave::VideoMetaArgs v;
    v.duration = Timestamp::from_seconds(10);
    v.width = 1920;
    v.height = 1080;
    v.frame_rate = 25.0;
    const ffweave::Meta vm = ffweave::video_meta_data(v);
    require(vm.kind == ffweave::StreamKind::Video, "video kind");
    require(vm.frames == 250, "frames derived from rate and duration");
    require(std::fabs(vm.dar - 1920.0 / 1080.0) < 1e-9, "dar derived from size");
    require(vm.scenes.size() == 1, "one scene");
    require(vm.scenes[0].duration == v.duration && vm.scenes[0].position.is_zero(), "scene spans stream");
    require(vm.streams.empty(), "no stream id until attached to an input");

    ffweave::AudioMetaArgs a_args;
    a_args.duration = Timestamp::from_seconds(2);
    a_args.sample_rate = 48000;
    a_args.channels = 2;
    a_args.stream = "song.wav#0";
    const ffweave::Meta am = ffweave::audio_meta_data(a_args);
    require(am.samples == 96000, "samples derived from rate and duration");
    require(am.streams.size() == 1 && am.streams[0] == "song.wav#0", "stream id kept");
    require(ffweave::describe(am.scenes[0]) == "song.wav#0[0.0,2.0)@0.0", "scene description");

    std::cout << "[OK] unit_timestamp_meta_test passed\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] " << e.what() << "\n";
    return 1;
  }
}
