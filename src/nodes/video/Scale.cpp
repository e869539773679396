#include "ffweave/nodes/video/Scale.h"

#include <stdexcept>
#include <string>

namespace ffweave {

int64_t rescale_nearest(int64_t a, int64_t b, int64_t c) {
  if (c == 0) throw std::invalid_argument("rescale_nearest: zero divisor");
  if (c < 0) {
    a = -a;
    c = -c;
  }
  const int64_t p = a * b;
  const int64_t r = c / 2;
  return p >= 0 ? (p + r) / c : -((-p + r) / c);
}

Scale::Scale(int width, int height)
  : Filter({StreamKind::Video}, {StreamKind::Video}), width_(width), height_(height) {}

std::vector<FilterParam> Scale::params() const {
  return {{"w", static_cast<int64_t>(width_)}, {"h", static_cast<int64_t>(height_)}};
}

std::shared_ptr<Filter> Scale::clone() const {
  return std::make_shared<Scale>(width_, height_);
}

std::pair<int, int> Scale::output_size(int in_width, int in_height) const {
  int w = width_ == 0 ? in_width : width_;
  int h = height_ == 0 ? in_height : height_;

  const int factor_w = w < -1 ? -w : 1;
  const int factor_h = h < -1 ? -h : 1;

  if (w < 0 && h < 0) {
    return {in_width, in_height};
  }
  if (w < 0) {
    if (in_height == 0) throw std::invalid_argument("Scale: input height is zero");
    w = static_cast<int>(rescale_nearest(h, in_width, static_cast<int64_t>(in_height) * factor_w) *
                         factor_w);
  }
  if (h < 0) {
    if (in_width == 0) throw std::invalid_argument("Scale: input width is zero");
    h = static_cast<int>(rescale_nearest(w, in_height, static_cast<int64_t>(in_width) * factor_h) *
                         factor_h);
  }
  return {w, h};
}

std::vector<Meta> Scale::transform(const std::vector<Meta>& metas) const {
  Meta out = metas.front();
  const auto size = output_size(out.width, out.height);
  out.width = size.first;
  out.height = size.second;
  if (out.width != 0 && out.height != 0 && out.dar > 0.0) {
    out.par = out.dar * out.height / out.width;
  }
  return {out};
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Scale> Scale(int width, int height) {
  return std::make_shared<ffweave::Scale>(width, height);
}

} // namespace ffweave::nodes
