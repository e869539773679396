#include "ffweave/nodes/common/CustomFilter.h"

#include <stdexcept>

namespace ffweave {

CustomFilter::CustomFilter(StreamKind kind, std::string name, std::vector<FilterParam> params,
                           int input_count, int output_count)
  : Filter(std::vector<StreamKind>(input_count > 0 ? input_count : 0, kind),
           std::vector<StreamKind>(output_count > 0 ? output_count : 0, kind)),
    kind_(kind),
    name_(std::move(name)),
    params_(std::move(params)),
    input_count_(input_count),
    output_count_(output_count) {
  if (name_.empty()) throw std::invalid_argument("CustomFilter: filter name is empty");
  if (input_count < 1 || output_count < 1) {
    throw std::invalid_argument("CustomFilter(" + name_ + "): needs at least one input and output");
  }
  for (char c : name_) {
    if (c == '=' || c == ',' || c == ';' || c == '[' || c == ']') {
      throw std::invalid_argument("CustomFilter: invalid character in filter name '" + name_ + "'");
    }
  }
}

std::shared_ptr<Filter> CustomFilter::clone() const {
  return std::make_shared<CustomFilter>(kind_, name_, params_, input_count_, output_count_);
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::CustomFilter> Custom(StreamKind kind, std::string name,
                                              std::vector<FilterParam> params,
                                              int input_count, int output_count) {
  return std::make_shared<ffweave::CustomFilter>(kind, std::move(name), std::move(params),
                                                 input_count, output_count);
}

} // namespace ffweave::nodes
