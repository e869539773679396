#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>
#include <string>
#include <vector>

namespace ffweave {

// Escape hatch for any ffmpeg filter without a typed node.
// Metadata of input 0 is passed to every output.
class CustomFilter final : public Filter {
public:
  CustomFilter(StreamKind kind, std::string name, std::vector<FilterParam> params = {},
               int input_count = 1, int output_count = 1);

  std::string kind() const override { return "CustomFilter"; }
  std::string filter_name() const override { return name_; }
  std::vector<FilterParam> params() const override { return params_; }
  std::shared_ptr<Filter> clone() const override;

private:
  StreamKind kind_;
  std::string name_;
  std::vector<FilterParam> params_;
  int input_count_;
  int output_count_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::CustomFilter> Custom(StreamKind kind, std::string name,
                                              std::vector<FilterParam> params = {},
                                              int input_count = 1, int output_count = 1);
} // namespace ffweave::nodes
