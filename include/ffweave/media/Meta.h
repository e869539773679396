#pragma once

#include "ffweave/media/Timestamp.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ffweave {

enum class StreamKind {
  Video,
  Audio,
};

// Label tag used by ffmpeg stream specifiers ("v" / "a").
inline const char* kind_tag(StreamKind k) {
  return k == StreamKind::Video ? "v" : "a";
}

inline const char* to_string(StreamKind k) {
  return k == StreamKind::Video ? "VIDEO" : "AUDIO";
}

/**
 * @brief Contiguous part of a source stream represented in the current stream.
 *
 * `start` is the first frame timestamp in the source stream, `position` is the
 * first frame timestamp in the stream that carries this scene.
 */
struct Scene {
  std::string stream;  // source stream id ("input.mp4#0")
  Timestamp start;
  Timestamp duration;
  Timestamp position;

  Timestamp end() const { return start + duration; }
  Timestamp position_end() const { return position + duration; }
};

// Hardware device a video stream was uploaded to.
struct Device {
  std::string hardware; // e.g. "cuda"
  std::string name;     // e.g. "foo"
};

/**
 * @brief Stream metadata, video and audio in one record.
 *
 * Video-only and audio-only fields stay at their defaults for the other kind.
 */
struct Meta {
  StreamKind kind = StreamKind::Video;
  Timestamp duration;
  Timestamp start;
  int64_t bitrate = 0;
  std::vector<Scene> scenes;
  // Scenes of overlay top inputs drawn into this stream, on this stream's timeline.
  std::vector<Scene> overlays;
  std::vector<std::string> streams;

  // Video
  int width = 0;
  int height = 0;
  double par = 1.0;
  double dar = 0.0;
  double frame_rate = 0.0;
  int64_t frames = 0;
  std::optional<Device> device;

  // Audio
  int sample_rate = 0;
  int channels = 0;
  int64_t samples = 0;

  Timestamp end() const { return start + duration; }
};

struct VideoMetaArgs {
  Timestamp duration;
  Timestamp start;
  int64_t bitrate = 0;
  int width = 0;
  int height = 0;
  double par = 1.0;
  double dar = 0.0; // 0 means "derive from width/height/par"
  double frame_rate = 0.0;
  int64_t frames = 0;
  std::string stream;
};

struct AudioMetaArgs {
  Timestamp duration;
  Timestamp start;
  int64_t bitrate = 0;
  int sample_rate = 0;
  int channels = 0;
  int64_t samples = 0;
  std::string stream;
};

// Builders seeding a single scene that spans the whole stream.
Meta video_meta_data(const VideoMetaArgs& args);
Meta audio_meta_data(const AudioMetaArgs& args);

// Frame / sample count covered by an interval.
int64_t frames_in(const Meta& meta, Timestamp interval);
int64_t samples_in(const Meta& meta, Timestamp interval);

std::string describe(const Scene& s);

} // namespace ffweave
