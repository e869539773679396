#include "ffweave/nodes/common/Trim.h"

#include <algorithm>
#include <stdexcept>

namespace ffweave {

Trim::Trim(StreamKind kind, Timestamp start, Timestamp end)
  : Filter({kind}, {kind}), kind_(kind), start_(start), end_(end) {
  if (start_ < Timestamp()) {
    throw std::invalid_argument("Trim: start must not be negative (" + start_.to_string() + ")");
  }
  if (end_ <= start_) {
    throw std::invalid_argument("Trim: end " + end_.to_string() + " must be after start " +
                                start_.to_string());
  }
}

std::string Trim::filter_name() const {
  return kind_ == StreamKind::Video ? "trim" : "atrim";
}

std::vector<FilterParam> Trim::params() const {
  return {{"start", start_}, {"end", end_}};
}

std::shared_ptr<Filter> Trim::clone() const {
  return std::make_shared<Trim>(kind_, start_, end_);
}

std::vector<Scene> Trim::cut_(const std::vector<Scene>& scenes) const {
  std::vector<Scene> out;
  for (const auto& sc : scenes) {
    const Timestamp from = max_ts(start_, sc.position);
    const Timestamp to = min_ts(end_, sc.position_end());
    if (from >= to) continue;
    // Scenes may be reordered in source time, e.g. input[3:4] + input[1:2].
    out.push_back(Scene{sc.stream, sc.start + (from - sc.position), to - from, from});
  }
  return out;
}

std::vector<Meta> Trim::transform(const std::vector<Meta>& metas) const {
  const Meta& in = metas.front();
  Meta out = in;
  out.streams.clear();
  out.scenes = cut_(in.scenes);
  out.overlays = cut_(in.overlays);

  for (const auto& sc : out.scenes) {
    if (!sc.stream.empty() &&
        std::find(out.streams.begin(), out.streams.end(), sc.stream) == out.streams.end()) {
      out.streams.push_back(sc.stream);
    }
  }

  out.start = start_;
  out.duration = end_ - start_;
  if (in.kind == StreamKind::Video) {
    out.frames = frames_in(in, out.duration);
  } else {
    out.samples = samples_in(in, out.duration);
  }
  return {out};
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Trim> Trim(StreamKind kind, Timestamp start, Timestamp end) {
  return std::make_shared<ffweave::Trim>(kind, start, end);
}

} // namespace ffweave::nodes
