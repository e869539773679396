#pragma once

#include "ffweave/builder/Graph.h"
#include "ffweave/encoding/Codec.h"
#include "ffweave/encoding/Input.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ffweave {

class Filter;
class Stream;

// Result of one render pass.
struct RenderedGraph {
  // Filter graph text; empty when no filter is used.
  std::string text;
  // `text` is a comma-joined chain applied as chain_codec's per-stream filter.
  bool short_form = false;
  const Codec* chain_codec = nullptr;
  // -map value for every codec, in codec order: "0:v" or "[vout0]".
  std::vector<std::pair<const Codec*, std::string>> maps;

  // @throws UnresolvedReferenceError for an unknown codec.
  const std::string& map_for(const Codec& codec) const;
};

/**
 * @brief Graph assembler: freezes the Stream structure and renders it.
 *
 * Walks from the inputs' streams in declaration order, checks the structure
 * (cycles, dangling outputs, unbound inputs, unregistered sources), orders
 * filters topologically with ties broken by discovery order and assigns
 * labels. The label counter lives here and restarts on every render(), so
 * rendering an unchanged graph twice gives identical text.
 */
class FilterComplex final {
public:
  FilterComplex(std::vector<std::shared_ptr<Input>> inputs,
                std::vector<std::shared_ptr<Codec>> codecs);

  // @throws GraphError subclasses; nothing is returned on failure.
  RenderedGraph render();

  // Frozen graph of the last successful render (inputs, filters, codecs).
  const Graph& graph() const noexcept { return graph_; }

private:
  void reset_();
  void freeze_();
  void discover_stream_(Graph::NodeId from, const Stream& s);
  void visit_filter_(const std::shared_ptr<Node>& filter);
  Graph::NodeId add_codec_(const std::shared_ptr<Node>& codec);
  void check_bound_(const Node& node) const;
  void assign_labels_();
  std::vector<const Filter*> chain_() const;
  std::string input_labels_(const Node& node) const;
  std::string output_labels_(const Node& node) const;

  std::vector<std::shared_ptr<Input>> inputs_;
  std::vector<std::shared_ptr<Codec>> codecs_;

  Graph graph_;
  std::unordered_map<const Node*, Graph::NodeId> ids_;
  std::unordered_map<const Node*, int> color_; // 1 = in progress, 2 = done
  std::vector<std::pair<std::size_t, const Stream*>> edge_streams_;
  std::vector<const Filter*> order_;
  std::unordered_map<const Stream*, std::string> labels_;
  int counter_ = 0;
};

} // namespace ffweave
