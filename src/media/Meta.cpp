#include "ffweave/media/Meta.h"

#include <cmath>
#include <sstream>
#include <string>

namespace ffweave {

Meta video_meta_data(const VideoMetaArgs& args) {
  Meta m;
  m.kind = StreamKind::Video;
  m.duration = args.duration;
  m.start = args.start;
  m.bitrate = args.bitrate;
  m.width = args.width;
  m.height = args.height;
  m.par = args.par;
  if (args.dar > 0.0) {
    m.dar = args.dar;
  } else if (args.height != 0) {
    m.dar = static_cast<double>(args.width) / args.height * args.par;
  }
  m.frames = args.frames;
  if (args.frame_rate > 0.0) {
    m.frame_rate = args.frame_rate;
  } else if (!args.duration.is_zero()) {
    m.frame_rate = static_cast<double>(args.frames) / args.duration.seconds();
  }
  if (m.frames == 0 && m.frame_rate > 0.0) {
    m.frames = frames_in(m, args.duration);
  }

  m.scenes.push_back(Scene{args.stream, args.start, args.duration, args.start});
  if (!args.stream.empty()) m.streams.push_back(args.stream);
  return m;
}

Meta audio_meta_data(const AudioMetaArgs& args) {
  Meta m;
  m.kind = StreamKind::Audio;
  m.duration = args.duration;
  m.start = args.start;
  m.bitrate = args.bitrate;
  m.sample_rate = args.sample_rate;
  m.channels = args.channels;
  m.samples = args.samples;
  if (m.samples == 0 && m.sample_rate > 0) {
    m.samples = samples_in(m, args.duration);
  }

  m.scenes.push_back(Scene{args.stream, args.start, args.duration, args.start});
  if (!args.stream.empty()) m.streams.push_back(args.stream);
  return m;
}

int64_t frames_in(const Meta& meta, Timestamp interval) {
  return static_cast<int64_t>(std::llround(interval.seconds() * meta.frame_rate));
}

int64_t samples_in(const Meta& meta, Timestamp interval) {
  return static_cast<int64_t>(std::llround(interval.seconds() * meta.sample_rate));
}

std::string describe(const Scene& s) {
  std::ostringstream ss;
  ss << (s.stream.empty() ? "?" : s.stream)
     << "[" << s.start.to_string() << "," << s.end().to_string() << ")"
     << "@" << s.position.to_string();
  return ss.str();
}

} // namespace ffweave
