#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>

namespace ffweave {

// Draws input 1 (top) over input 0 (bottom) at (x, y).
// Output metadata is the bottom input's. Top scenes move to Meta::overlays.
class Overlay final : public Filter {
public:
  Overlay(int x = 0, int y = 0);

  static constexpr std::size_t kBottom = 0;
  static constexpr std::size_t kTop = 1;

  std::string kind() const override { return "Overlay"; }
  std::string filter_name() const override { return "overlay"; }
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

protected:
  std::vector<Meta> transform(const std::vector<Meta>& metas) const override;

private:
  int x_;
  int y_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Overlay> Overlay(int x = 0, int y = 0);
} // namespace ffweave::nodes
