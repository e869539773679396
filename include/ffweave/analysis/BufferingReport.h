#pragma once

#include "ffweave/media/Meta.h"

#include <map>
#include <string>
#include <vector>

namespace ffweave {

enum class HazardKind {
  // One codec needs a later part of a source before an earlier one.
  Reorder,
  // Two codecs need the same source frames at different output times.
  Divergent,
};

const char* to_string(HazardKind kind);

struct BufferingHazard {
  HazardKind kind = HazardKind::Divergent;
  std::string source; // source stream id ("input.mp4#0")
  std::string first_codec;
  std::string second_codec; // equals first_codec for Reorder
  Scene first;
  Scene second;

  std::string message() const;
};

/**
 * @brief Result of a buffering analysis. Hazards are data, not exceptions;
 * the caller decides whether they are fatal.
 */
struct BufferingReport {
  std::vector<BufferingHazard> hazards;
  // Codecs left out because metadata was unknown.
  std::vector<std::string> skipped;

  bool ok() const noexcept { return hazards.empty(); }
  std::map<std::string, std::vector<BufferingHazard>> by_source() const;

  std::string to_string() const;
  std::string to_json() const;
};

} // namespace ffweave
