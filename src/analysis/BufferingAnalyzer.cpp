#include "ffweave/analysis/BufferingAnalyzer.h"

#include "ffweave/builder/Stream.h"
#include "ffweave/pipeline/Errors.h"
#include "ffweave/pipeline/internal/Env.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace ffweave {

namespace {

struct Segment {
  std::size_t codec = 0;
  Scene scene;
};

Timestamp lag(const Scene& s) {
  return s.position - s.start;
}

} // namespace

BufferingAnalyzer::BufferingAnalyzer(BufferingOptions opt) : opt_(opt) {}

std::optional<std::vector<Scene>> BufferingAnalyzer::read_segments(const Codec& codec) const {
  auto meta = codec.input_meta();
  if (!meta) return std::nullopt;
  std::vector<Scene> segments = meta->scenes;
  segments.insert(segments.end(), meta->overlays.begin(), meta->overlays.end());
  return segments;
}

BufferingReport BufferingAnalyzer::analyze(const std::vector<std::shared_ptr<Codec>>& codecs) const {
  BufferingReport report;
  const bool log = pipeline_internal::env_bool("FFWEAVE_DEBUG_BUFFERING_LOG", false);

  std::vector<std::string> names;
  std::vector<std::string> stream_order;
  std::map<std::string, std::vector<Segment>> by_stream;

  for (std::size_t i = 0; i < codecs.size(); ++i) {
    const Codec& codec = *codecs[i];
    names.push_back(codec.display_name());
    auto segments = codec.input_stream() ? read_segments(codec) : std::nullopt;
    if (!segments) {
      if (opt_.require_metadata) {
        throw MetadataRequiredError("BufferingAnalyzer: metadata is unknown for " + names.back());
      }
      report.skipped.push_back(names.back());
      if (log) std::cerr << "[Buffering] skip " << names.back() << ": no metadata\n";
      continue;
    }
    for (const auto& sc : *segments) {
      if (sc.stream.empty() || sc.duration.is_zero()) continue;
      if (!by_stream.count(sc.stream)) stream_order.push_back(sc.stream);
      by_stream[sc.stream].push_back({i, sc});
      if (log) std::cerr << "[Buffering] " << names.back() << " reads " << describe(sc) << "\n";
    }
  }

  for (const auto& stream : stream_order) {
    const auto& segments = by_stream.at(stream);

    // Reorder: per codec, in output order.
    std::set<std::size_t> codec_ids;
    for (const auto& s : segments) codec_ids.insert(s.codec);
    for (std::size_t c : codec_ids) {
      std::vector<Scene> own;
      for (const auto& s : segments) {
        if (s.codec == c) own.push_back(s.scene);
      }
      std::stable_sort(own.begin(), own.end(), [](const Scene& a, const Scene& b) {
        return a.position < b.position;
      });
      for (std::size_t k = 1; k < own.size(); ++k) {
        const Scene& prev = own[k - 1];
        const Scene& cur = own[k];
        if (prev.end() > cur.start && lag(prev) != lag(cur)) {
          report.hazards.push_back({HazardKind::Reorder, stream, names[c], names[c], prev, cur});
          break;
        }
      }
    }

    // Divergent: codec pairs reading the same frames with different lags.
    std::set<std::pair<std::size_t, std::size_t>> flagged;
    for (std::size_t a = 0; a < segments.size(); ++a) {
      for (std::size_t b = a + 1; b < segments.size(); ++b) {
        const Segment& x = segments[a];
        const Segment& y = segments[b];
        if (x.codec == y.codec) continue;
        const std::pair<std::size_t, std::size_t> key(std::min(x.codec, y.codec),
                                                      std::max(x.codec, y.codec));
        if (flagged.count(key)) continue;
        const bool overlap = max_ts(x.scene.start, y.scene.start) < min_ts(x.scene.end(), y.scene.end());
        if (!overlap || lag(x.scene) == lag(y.scene)) continue;
        flagged.insert(key);
        const Segment& first = x.codec < y.codec ? x : y;
        const Segment& second = x.codec < y.codec ? y : x;
        report.hazards.push_back({HazardKind::Divergent, stream, names[first.codec],
                                  names[second.codec], first.scene, second.scene});
      }
    }
  }

  if (log) std::cerr << "[Buffering] " << report.to_string() << "\n";
  return report;
}

} // namespace ffweave
