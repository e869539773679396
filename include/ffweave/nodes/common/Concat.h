#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>

namespace ffweave {

/**
 * @brief Joins N streams of one kind end to end.
 *
 * Output scenes are the input scenes in input order, moved onto the joined
 * timeline. Mixed kinds raise IncompatibleStreamsError.
 */
class Concat final : public Filter {
public:
  Concat(StreamKind kind, int input_count = 2);

  std::string kind() const override { return "Concat"; }
  std::string filter_name() const override { return "concat"; }
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

  void check_input(std::size_t slot, const Stream& stream) const override;
  void check_kind(const Stream& stream) const override;

protected:
  std::vector<Meta> transform(const std::vector<Meta>& metas) const override;
  void validate_inputs() const override;

private:
  StreamKind kind_;
  int input_count_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Concat> Concat(StreamKind kind, int input_count = 2);
} // namespace ffweave::nodes
