#include "ffweave/nodes/video/Format.h"

#include <stdexcept>

namespace ffweave {

Format::Format(std::string pix_fmt)
  : Filter({StreamKind::Video}, {StreamKind::Video}), pix_fmt_(std::move(pix_fmt)) {
  if (pix_fmt_.empty()) throw std::invalid_argument("Format: pix_fmt is empty");
}

std::vector<FilterParam> Format::params() const {
  return {{"pix_fmts", pix_fmt_}};
}

std::shared_ptr<Filter> Format::clone() const {
  return std::make_shared<Format>(pix_fmt_);
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Format> Format(std::string pix_fmt) {
  return std::make_shared<ffweave::Format>(std::move(pix_fmt));
}

} // namespace ffweave::nodes
