#pragma once

#include "ffweave/builder/Node.h"
#include "ffweave/media/Meta.h"
#include "ffweave/media/Timestamp.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ffweave {

// Typed filter parameter value. std::monostate means "not set".
using ParamValue = std::variant<std::monostate, int64_t, double, std::string, Timestamp>;

// One `key=value` item of a filter's argument list. An empty name renders
// the value positionally (`split=3`).
struct FilterParam {
  std::string name;
  ParamValue value;
};

// Unset, zero and empty values are left out of the rendered arguments.
bool is_omitted(const ParamValue& v);
std::string render_value(const ParamValue& v);

/**
 * @brief Base class of every ffmpeg filter node.
 *
 * Subclasses declare their slot kinds, name and parameters, validate their
 * parameters in the constructor (std::invalid_argument) and provide a
 * metadata transform. Output metadata is computed on demand from the inputs
 * and stays unknown while any input metadata is unknown.
 */
class Filter : public Node {
public:
  Filter(std::vector<StreamKind> input_kinds, std::vector<StreamKind> output_kinds);

  NodeRole role() const override { return NodeRole::Filter; }
  std::string kind() const override { return "Filter"; }
  std::string user_label() const override { return render(); }

  // ffmpeg filter name ("scale", "atrim").
  virtual std::string filter_name() const = 0;
  virtual std::vector<FilterParam> params() const { return {}; }

  // "w=1280:h=720"; empty when every parameter is omitted.
  std::string args() const;
  // "scale=w=1280:h=720" or "split".
  std::string render() const;

  std::optional<Meta> output_meta(std::size_t slot) const override;

  // Unconnected copy with identical parameters.
  virtual std::shared_ptr<Filter> clone() const = 0;

  // Same filter and same rendered parameters.
  bool same_as(const Filter& other) const;

protected:
  // Called with metadata for every input slot; returns one Meta per output.
  // Default: every output gets a copy of input 0.
  virtual std::vector<Meta> transform(const std::vector<Meta>& metas) const;

  // Runs once all inputs are bound.
  virtual void validate_inputs() const {}

  void on_inputs_bound() override;

private:
  // Set while transform() runs; a cycle reads back unknown metadata.
  mutable bool propagating_ = false;
};

} // namespace ffweave
