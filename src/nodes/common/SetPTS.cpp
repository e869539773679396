#include "ffweave/nodes/common/SetPTS.h"

#include <stdexcept>

namespace ffweave {

SetPTS::SetPTS(StreamKind kind, std::string expr)
  : Filter({kind}, {kind}), kind_(kind), expr_(std::move(expr)) {
  if (expr_.empty()) throw std::invalid_argument("SetPTS: expression is empty");
}

std::string SetPTS::filter_name() const {
  return kind_ == StreamKind::Video ? "setpts" : "asetpts";
}

std::vector<FilterParam> SetPTS::params() const {
  return {{"", expr_}};
}

std::shared_ptr<Filter> SetPTS::clone() const {
  return std::make_shared<SetPTS>(kind_, expr_);
}

std::vector<Meta> SetPTS::transform(const std::vector<Meta>& metas) const {
  Meta out = metas.front();
  if (expr_ != kStartPts) return {out};

  for (auto& sc : out.scenes) sc.position -= out.start;
  for (auto& sc : out.overlays) sc.position -= out.start;
  out.start = Timestamp();
  return {out};
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::SetPTS> SetPTS(StreamKind kind, std::string expr) {
  return std::make_shared<ffweave::SetPTS>(kind, std::move(expr));
}

} // namespace ffweave::nodes
