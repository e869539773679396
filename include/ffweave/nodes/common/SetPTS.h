#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>
#include <string>

namespace ffweave {

// Only PTS-STARTPTS is modeled: it moves the stream to start at zero.
// Other expressions leave metadata untouched.
class SetPTS final : public Filter {
public:
  static constexpr const char* kStartPts = "PTS-STARTPTS";

  explicit SetPTS(StreamKind kind, std::string expr = kStartPts);

  std::string kind() const override { return "SetPTS"; }
  std::string filter_name() const override;
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

  const std::string& expr() const noexcept { return expr_; }

protected:
  std::vector<Meta> transform(const std::vector<Meta>& metas) const override;

private:
  StreamKind kind_;
  std::string expr_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::SetPTS> SetPTS(StreamKind kind, std::string expr = ffweave::SetPTS::kStartPts);
} // namespace ffweave::nodes
