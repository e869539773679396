#include "ffweave/nodes/video/Overlay.h"

namespace ffweave {

Overlay::Overlay(int x, int y)
  : Filter({StreamKind::Video, StreamKind::Video}, {StreamKind::Video}), x_(x), y_(y) {}

std::vector<FilterParam> Overlay::params() const {
  return {{"x", static_cast<int64_t>(x_)}, {"y", static_cast<int64_t>(y_)}};
}

std::shared_ptr<Filter> Overlay::clone() const {
  return std::make_shared<Overlay>(x_, y_);
}

std::vector<Meta> Overlay::transform(const std::vector<Meta>& metas) const {
  Meta out = metas[kBottom];
  const Meta& top = metas[kTop];
  out.overlays.insert(out.overlays.end(), top.scenes.begin(), top.scenes.end());
  out.overlays.insert(out.overlays.end(), top.overlays.begin(), top.overlays.end());
  return {out};
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Overlay> Overlay(int x, int y) {
  return std::make_shared<ffweave::Overlay>(x, y);
}

} // namespace ffweave::nodes
