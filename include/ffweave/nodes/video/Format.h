#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>
#include <string>

namespace ffweave {

// Pixel format conversion (`format=pix_fmts=yuv420p`).
class Format final : public Filter {
public:
  explicit Format(std::string pix_fmt);

  std::string kind() const override { return "Format"; }
  std::string filter_name() const override { return "format"; }
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

  const std::string& pix_fmt() const noexcept { return pix_fmt_; }

private:
  std::string pix_fmt_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Format> Format(std::string pix_fmt);
} // namespace ffweave::nodes
