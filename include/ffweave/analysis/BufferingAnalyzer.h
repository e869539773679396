#pragma once

#include "ffweave/analysis/BufferingReport.h"
#include "ffweave/encoding/Codec.h"

#include <memory>
#include <optional>
#include <vector>

namespace ffweave {

struct BufferingOptions {
  // Throw MetadataRequiredError instead of skipping codecs without metadata.
  bool require_metadata = false;
};

/**
 * @brief Predicts when ffmpeg's single read schedule forces unbounded buffering.
 *
 * ffmpeg decodes every source once, in timestamp order, and feeds all readers.
 * A codec reads a source segment [start, end) at output time `position`; its
 * lag is position - start. Hazards:
 *  - Reorder: one codec reads an earlier part of a source after a later part.
 *  - Divergent: two codecs read overlapping source frames with different lags.
 * Overlay top inputs count as segments read by the codec downstream, at the
 * positions the filters after the Overlay move them to.
 */
class BufferingAnalyzer final {
public:
  explicit BufferingAnalyzer(BufferingOptions opt = {});

  BufferingReport analyze(const std::vector<std::shared_ptr<Codec>>& codecs) const;

  // Source segments read by a codec; std::nullopt when any metadata is unknown.
  std::optional<std::vector<Scene>> read_segments(const Codec& codec) const;

private:
  BufferingOptions opt_;
};

} // namespace ffweave
