#include "ffweave/nodes/common/Concat.h"

#include "ffweave/builder/Stream.h"
#include "ffweave/pipeline/Errors.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ffweave {

Concat::Concat(StreamKind kind, int input_count)
  : Filter(std::vector<StreamKind>(input_count > 0 ? input_count : 0, kind), {kind}),
    kind_(kind),
    input_count_(input_count) {
  if (input_count < 1) {
    throw std::invalid_argument("Concat: input_count must be >= 1, got " +
                                std::to_string(input_count));
  }
}

std::vector<FilterParam> Concat::params() const {
  const auto n = static_cast<int64_t>(input_count_);
  if (kind_ == StreamKind::Audio) {
    // Stream counts are literal strings so that v=0 is not dropped.
    return {{"v", std::string("0")}, {"a", std::string("1")}, {"n", n}};
  }
  if (input_count_ == 2) return {};
  return {{"n", n}};
}

std::shared_ptr<Filter> Concat::clone() const {
  return std::make_shared<Concat>(kind_, input_count_);
}

void Concat::check_input(std::size_t slot, const Stream& stream) const {
  check_kind(stream);
  Filter::check_input(slot, stream);
}

void Concat::check_kind(const Stream& stream) const {
  if (stream.kind() != kind_) {
    throw IncompatibleStreamsError("Concat: " + std::string(to_string(kind_)) +
                                   " concat can't take " + to_string(stream.kind()) + " input " +
                                   stream.describe());
  }
}

void Concat::validate_inputs() const {
  for (Stream* in : inputs_) {
    if (in->kind() != kind_) {
      throw IncompatibleStreamsError("Concat: mixed input kinds (" + in->describe() + ")");
    }
  }
}

std::vector<Meta> Concat::transform(const std::vector<Meta>& metas) const {
  for (const auto& m : metas) {
    if (m.kind != kind_) {
      throw IncompatibleStreamsError("Concat: input metadata kind " + std::string(to_string(m.kind)) +
                                     " does not match " + to_string(kind_));
    }
  }

  Meta out = metas.front();
  out.start = Timestamp();
  out.duration = Timestamp();
  out.scenes.clear();
  out.overlays.clear();
  out.streams.clear();
  out.frames = 0;
  out.samples = 0;
  out.bitrate = 0;

  for (const auto& m : metas) {
    for (const auto& sc : m.scenes) {
      Scene moved = sc;
      moved.position = out.duration + (sc.position - m.start);
      out.scenes.push_back(std::move(moved));
    }
    for (const auto& sc : m.overlays) {
      Scene moved = sc;
      moved.position = out.duration + (sc.position - m.start);
      out.overlays.push_back(std::move(moved));
    }
    for (const auto& s : m.streams) {
      if (std::find(out.streams.begin(), out.streams.end(), s) == out.streams.end()) {
        out.streams.push_back(s);
      }
    }
    out.duration += m.duration;
    out.frames += m.frames;
    out.samples += m.samples;
    out.bitrate = std::max(out.bitrate, m.bitrate);
  }
  return {out};
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Concat> Concat(StreamKind kind, int input_count) {
  return std::make_shared<ffweave::Concat>(kind, input_count);
}

} // namespace ffweave::nodes
