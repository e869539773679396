#pragma once

#include "ffweave/builder/Filter.h"

#include <memory>

namespace ffweave {

/**
 * @brief Keeps the [start, end) part of a stream (`trim` / `atrim`).
 *
 * Timestamps are not shifted; follow with SetPTS("PTS-STARTPTS") to zero them.
 */
class Trim final : public Filter {
public:
  Trim(StreamKind kind, Timestamp start, Timestamp end);

  std::string kind() const override { return "Trim"; }
  std::string filter_name() const override;
  std::vector<FilterParam> params() const override;
  std::shared_ptr<Filter> clone() const override;

  Timestamp start() const noexcept { return start_; }
  Timestamp end() const noexcept { return end_; }

protected:
  std::vector<Meta> transform(const std::vector<Meta>& metas) const override;

private:
  // Scenes clipped to [start, end) in output time, positions unchanged.
  std::vector<Scene> cut_(const std::vector<Scene>& scenes) const;

  StreamKind kind_;
  Timestamp start_;
  Timestamp end_;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Trim> Trim(StreamKind kind, Timestamp start, Timestamp end);
} // namespace ffweave::nodes
