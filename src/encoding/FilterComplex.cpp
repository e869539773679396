#include "ffweave/encoding/FilterComplex.h"

#include "ffweave/builder/Filter.h"
#include "ffweave/builder/GraphPrinter.h"
#include "ffweave/builder/Stream.h"
#include "ffweave/pipeline/Errors.h"
#include "ffweave/pipeline/internal/Env.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace ffweave {

namespace {

std::size_t slot_of(const Node& dest, const Stream& s) {
  for (std::size_t i = 0; i < dest.input_count(); ++i) {
    if (dest.input(i) == &s) return i;
  }
  throw std::logic_error(dest.kind() + " lists " + s.describe() + " as input but is not bound to it");
}

} // namespace

const std::string& RenderedGraph::map_for(const Codec& codec) const {
  for (const auto& m : maps) {
    if (m.first == &codec) return m.second;
  }
  throw UnresolvedReferenceError("no map entry for codec " + codec.display_name());
}

FilterComplex::FilterComplex(std::vector<std::shared_ptr<Input>> inputs,
                             std::vector<std::shared_ptr<Codec>> codecs)
  : inputs_(std::move(inputs)), codecs_(std::move(codecs)) {
  for (const auto& in : inputs_) {
    if (!in) throw std::invalid_argument("FilterComplex: null input");
  }
  for (const auto& c : codecs_) {
    if (!c) throw std::invalid_argument("FilterComplex: null codec");
  }
}

void FilterComplex::reset_() {
  graph_ = Graph();
  ids_.clear();
  color_.clear();
  edge_streams_.clear();
  order_.clear();
  labels_.clear();
  counter_ = 0;
}

RenderedGraph FilterComplex::render() {
  reset_();
  freeze_();
  assign_labels_();

  RenderedGraph out;
  const auto chain = chain_();
  if (!chain.empty()) {
    out.short_form = true;
    for (const Filter* f : chain) {
      if (!out.text.empty()) out.text += ',';
      out.text += f->render();
    }
    out.chain_codec = static_cast<const Codec*>(chain.back()->output(0)->dests().front().get());
  } else {
    for (const Filter* f : order_) {
      if (!out.text.empty()) out.text += ';';
      out.text += input_labels_(*f) + f->render() + output_labels_(*f);
    }
  }

  for (const auto& c : codecs_) {
    const Stream* s = c->input_stream();
    if (out.short_form && c.get() == out.chain_codec) {
      out.maps.emplace_back(c.get(), labels_.at(chain.front()->input(0)));
      continue;
    }
    auto it = labels_.find(s);
    if (it == labels_.end()) {
      throw UnresolvedReferenceError("FilterComplex: no label for " + s->describe() + " feeding " +
                                     c->display_name());
    }
    out.maps.emplace_back(c.get(), s->is_source() ? it->second : "[" + it->second + "]");
  }

  if (pipeline_internal::env_bool("FFWEAVE_DEBUG_RENDER_LOG", false)) {
    std::cerr << "[FilterComplex] " << order_.size() << " filter(s), "
              << (out.short_form ? "short" : "full") << " form: " << out.text << "\n";
    for (const auto& m : out.maps) {
      std::cerr << "[FilterComplex]   " << m.first->display_name() << " <- " << m.second << "\n";
    }
    std::cerr << GraphPrinter::to_text(graph_) << "\n";
  }
  return out;
}

void FilterComplex::freeze_() {
  for (const auto& in : inputs_) {
    if (in->index() < 0) {
      throw UnresolvedReferenceError("FilterComplex: Input(" + in->file() + ") has no index");
    }
    ids_[in.get()] = graph_.add(in);
  }

  for (const auto& in : inputs_) {
    const Graph::NodeId id = ids_.at(in.get());
    for (std::size_t slot = 0; slot < in->output_count(); ++slot) {
      const Stream& s = *in->output(slot);
      labels_[&s] = in->stream_label(slot);
      discover_stream_(id, s);
    }
  }

  // Inputs coming from outside the walked graph (unregistered Input, orphan filter).
  for (const auto& kv : ids_) {
    const Node& n = *kv.first;
    if (n.role() != NodeRole::Filter) continue;
    check_bound_(n);
    for (std::size_t i = 0; i < n.input_count(); ++i) {
      if (!ids_.count(n.input(i)->owner())) {
        throw UnresolvedReferenceError("FilterComplex: " + n.kind() + " reads " +
                                       n.input(i)->describe() + " which no program input reaches");
      }
    }
  }

  for (const auto& c : codecs_) {
    const Stream* s = c->input_stream();
    if (!s) {
      throw UnresolvedReferenceError("FilterComplex: codec " + c->display_name() + " is not connected");
    }
    if (!ids_.count(s->owner())) {
      throw UnresolvedReferenceError("FilterComplex: codec " + c->display_name() + " reads " +
                                     s->describe() + " which no program input reaches");
    }
  }

  for (Graph::NodeId id : graph_.topo_order()) {
    const auto& n = graph_.node(id);
    if (n->role() != NodeRole::Filter) continue;
    const auto* f = dynamic_cast<const Filter*>(n.get());
    if (!f) throw std::logic_error("FilterComplex: " + n->kind() + " has Filter role but is not a Filter");
    order_.push_back(f);
  }
}

void FilterComplex::discover_stream_(Graph::NodeId from, const Stream& s) {
  for (const auto& dest : s.dests()) {
    if (dest->role() == NodeRole::Codec) {
      const Graph::NodeId cid = add_codec_(dest);
      if (cid == Graph::kInvalid) {
        // Source streams may feed codecs of other programs; filter outputs may not.
        if (!s.is_source()) {
          throw DanglingOutputError("FilterComplex: " + s.describe() +
                                    " feeds a codec that is not part of any output");
        }
        continue;
      }
      edge_streams_.emplace_back(graph_.add_edge(from, cid, s.slot(), 0), &s);
      continue;
    }

    auto c = color_.find(dest.get());
    if (c != color_.end() && c->second == 1) {
      throw CyclicGraphError("FilterComplex: cycle through " + dest->kind() + " (" +
                             dest->user_label() + ")");
    }
    const bool fresh = !ids_.count(dest.get());
    if (fresh) ids_[dest.get()] = graph_.add(dest);
    edge_streams_.emplace_back(graph_.add_edge(from, ids_.at(dest.get()), s.slot(), slot_of(*dest, s)), &s);
    if (fresh) visit_filter_(dest);
  }
}

void FilterComplex::visit_filter_(const std::shared_ptr<Node>& filter) {
  color_[filter.get()] = 1;
  const Graph::NodeId id = ids_.at(filter.get());
  for (const auto& out : filter->outputs()) {
    if (!out->connected()) {
      throw DanglingOutputError("FilterComplex: output " + std::to_string(out->slot()) + " of " +
                                filter->kind() + " (" + filter->user_label() + ") is not connected");
    }
    discover_stream_(id, *out);
  }
  color_[filter.get()] = 2;
}

Graph::NodeId FilterComplex::add_codec_(const std::shared_ptr<Node>& codec) {
  auto it = ids_.find(codec.get());
  if (it != ids_.end()) return it->second;
  const bool registered = std::any_of(codecs_.begin(), codecs_.end(),
                                      [&](const std::shared_ptr<Codec>& c) { return c == codec; });
  if (!registered) return Graph::kInvalid;
  const Graph::NodeId id = graph_.add(codec);
  ids_[codec.get()] = id;
  return id;
}

void FilterComplex::check_bound_(const Node& node) const {
  for (std::size_t i = 0; i < node.input_count(); ++i) {
    if (!node.input(i)) {
      throw UnresolvedReferenceError("FilterComplex: input " + std::to_string(i) + " of " +
                                     node.kind() + " (" + node.user_label() + ") is not connected");
    }
  }
}

void FilterComplex::assign_labels_() {
  for (const Filter* f : order_) {
    for (const auto& out : f->outputs()) {
      labels_[out.get()] = std::string(kind_tag(out->kind())) + "out" + std::to_string(counter_++);
    }
  }
  for (const auto& es : edge_streams_) {
    graph_.set_edge_label(es.first, labels_.at(es.second));
  }
}

std::vector<const Filter*> FilterComplex::chain_() const {
  if (order_.empty()) return {};
  for (const Filter* f : order_) {
    if (f->input_count() != 1 || f->output_count() != 1) return {};
  }
  const Filter* cur = order_.front();
  if (!cur->input(0)->is_source()) return {};

  std::vector<const Filter*> chain{cur};
  while (true) {
    const Node* next = cur->output(0)->dests().front().get();
    if (next->role() == NodeRole::Codec) break;
    cur = dynamic_cast<const Filter*>(next);
    if (!cur) return {};
    chain.push_back(cur);
  }
  if (chain.size() != order_.size()) return {};
  return chain;
}

std::string FilterComplex::input_labels_(const Node& node) const {
  std::string out;
  for (std::size_t i = 0; i < node.input_count(); ++i) {
    out += "[" + labels_.at(node.input(i)) + "]";
  }
  return out;
}

std::string FilterComplex::output_labels_(const Node& node) const {
  std::string out;
  for (const auto& s : node.outputs()) {
    out += "[" + labels_.at(s.get()) + "]";
  }
  return out;
}

} // namespace ffweave
