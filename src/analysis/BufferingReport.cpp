#include "ffweave/analysis/BufferingReport.h"

#include <nlohmann/json.hpp>

#include <sstream>

namespace ffweave {

namespace {

nlohmann::json scene_json(const Scene& s) {
  nlohmann::json j;
  j["stream"] = s.stream;
  j["start"] = s.start.seconds();
  j["end"] = s.end().seconds();
  j["position"] = s.position.seconds();
  return j;
}

} // namespace

const char* to_string(HazardKind kind) {
  return kind == HazardKind::Reorder ? "reorder" : "divergent";
}

std::string BufferingHazard::message() const {
  std::ostringstream oss;
  if (kind == HazardKind::Reorder) {
    oss << first_codec << " reads " << describe(second) << " after " << describe(first)
        << "; the earlier part must be buffered";
  } else {
    oss << first_codec << " reads " << describe(first) << " while " << second_codec << " reads "
        << describe(second) << "; " << source << " can't be read once for both";
  }
  return oss.str();
}

std::map<std::string, std::vector<BufferingHazard>> BufferingReport::by_source() const {
  std::map<std::string, std::vector<BufferingHazard>> out;
  for (const auto& h : hazards) out[h.source].push_back(h);
  return out;
}

std::string BufferingReport::to_string() const {
  std::ostringstream oss;
  if (hazards.empty()) {
    oss << "no buffering hazards";
  } else {
    oss << hazards.size() << " buffering hazard(s)";
    for (const auto& h : hazards) {
      oss << "\n  [" << ffweave::to_string(h.kind) << "] " << h.message();
    }
  }
  for (const auto& s : skipped) oss << "\n  skipped (no metadata): " << s;
  return oss.str();
}

std::string BufferingReport::to_json() const {
  nlohmann::json j;
  j["ok"] = ok();
  j["hazards"] = nlohmann::json::array();
  for (const auto& h : hazards) {
    nlohmann::json e;
    e["kind"] = ffweave::to_string(h.kind);
    e["source"] = h.source;
    e["codecs"] = {h.first_codec, h.second_codec};
    e["scenes"] = {scene_json(h.first), scene_json(h.second)};
    e["message"] = h.message();
    j["hazards"].push_back(std::move(e));
  }
  j["skipped"] = skipped;
  return j.dump(2);
}

} // namespace ffweave
