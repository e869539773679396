#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>

namespace ffweave {

// Audio gain (`volume=volume=0.50`).
class Volume final : public Filter {
public:
  explicit Volume(double level);

  std::string kind() const override { return "Volume"; }
  std::string filter_name() const override { return "volume"; }
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

  double level() const noexcept { return level_; }

private:
  double level_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Volume> Volume(double level);
} // namespace ffweave::nodes
