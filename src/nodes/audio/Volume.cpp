#include "ffweave/nodes/audio/Volume.h"

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace ffweave {

Volume::Volume(double level)
  : Filter({StreamKind::Audio}, {StreamKind::Audio}), level_(level) {
  if (!std::isfinite(level_) || level_ < 0.0) {
    throw std::invalid_argument("Volume: level must be a finite non-negative number");
  }
}

std::vector<FilterParam> Volume::params() const {
  // Rendered as text so that 0.00 (mute) is kept.
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", level_);
  return {{"volume", std::string(buf)}};
}

std::shared_ptr<Filter> Volume::clone() const {
  return std::make_shared<Volume>(level_);
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Volume> Volume(double level) {
  return std::make_shared<ffweave::Volume>(level);
}

} // namespace ffweave::nodes
