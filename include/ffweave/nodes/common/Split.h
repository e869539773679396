#pragma once

#include "ffweave/builder/Filter.h"

#include <cstddef>
#include <memory>

namespace ffweave {

class Stream;

// Fan-out: N copies of one stream (`split` / `asplit`).
class Split final : public Filter {
public:
  Split(StreamKind kind, int output_count = 2);

  std::string kind() const override { return "Split"; }
  std::string filter_name() const override;
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

  StreamKind stream_kind() const noexcept { return kind_; }

private:
  StreamKind kind_;
  int output_count_;
};

/**
 * @brief Reroutes an already consumed stream through a new Split.
 *
 * The single-use reader of `source` (its Filter for Source streams, its only
 * destination for Filter outputs) moves to Split output 0; outputs 1..N-1
 * stay free for the caller. When `source` has no such reader the Split is
 * simply connected and every output is free.
 */
class SplitInserter final {
public:
  static std::shared_ptr<Split> insert(Stream& source, int output_count);
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Split> Split(StreamKind kind, int output_count = 2);
} // namespace ffweave::nodes
