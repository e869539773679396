#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>
#include <utility>

namespace ffweave {

/**
 * @brief Resizes video frames (`scale=w=W:h=H`).
 *
 * Dimension rules follow ffmpeg's scale_eval:
 *  - 0 keeps the input dimension
 *  - -1 derives the dimension from the other one, keeping aspect ratio
 *  - -n does the same and rounds to a multiple of n
 *  - both negative keeps the input size
 * Display aspect ratio is kept; pixel aspect ratio is recomputed.
 */
class Scale final : public Filter {
public:
  Scale(int width, int height);

  std::string kind() const override { return "Scale"; }
  std::string filter_name() const override { return "scale"; }
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

  int width() const noexcept { return width_; }
  int height() const noexcept { return height_; }

  // Output size for a given input size.
  std::pair<int, int> output_size(int in_width, int in_height) const;

protected:
  std::vector<Meta> transform(const std::vector<Meta>& metas) const override;

private:
  int width_;
  int height_;
};

// ffmpeg av_rescale(a, b, c): a * b / c rounded to nearest, halfway away from zero.
int64_t rescale_nearest(int64_t a, int64_t b, int64_t c);

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Scale> Scale(int width, int height);
} // namespace ffweave::nodes
