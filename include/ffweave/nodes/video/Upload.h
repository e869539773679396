#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>
#include <string>

namespace ffweave {

// Moves frames to hardware memory (`hwupload_cuda=extra_hw_frames=64`).
// The target device is recorded in the output metadata.
class Upload final : public Filter {
public:
  static constexpr int kExtraHwFrames = 64;

  explicit Upload(std::string hardware = "cuda", std::string device = "");

  std::string kind() const override { return "Upload"; }
  std::string filter_name() const override { return "hwupload_" + hardware_; }
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

protected:
  std::vector<Meta> transform(const std::vector<Meta>& metas) const override;

private:
  std::string hardware_;
  std::string device_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Upload> Upload(std::string hardware = "cuda", std::string device = "");
} // namespace ffweave::nodes
