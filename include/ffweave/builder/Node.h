#pragma once

#include "ffweave/media/Meta.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ffweave {

class Stream;

enum class NodeRole {
  Source,
  Filter,
  Codec,
};

// =============================
// Graph Node API
// =============================
class Node {
public:
  Node(std::vector<StreamKind> input_kinds, std::vector<StreamKind> output_kinds);
  virtual ~Node() = default;

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  // Deterministic type label (used in reports and graph dumps).
  virtual std::string kind() const = 0;

  // Optional human label.
  virtual std::string user_label() const { return ""; }

  virtual NodeRole role() const = 0;

  // -------- Input slots --------
  std::size_t input_count() const noexcept { return inputs_.size(); }
  StreamKind input_kind(std::size_t slot) const;
  // Stream bound to a slot, or nullptr while the slot is free.
  Stream* input(std::size_t slot) const;
  bool inputs_bound() const noexcept;
  std::optional<std::size_t> first_free_slot() const noexcept;

  // Throws ConnectionError (or a subclass) when `stream` can't go into `slot`.
  virtual void check_input(std::size_t slot, const Stream& stream) const;

  // Nodes whose inputs share one kind reject a mismatching stream here.
  // pipe() calls it before reporting NoFreeSlotError.
  virtual void check_kind(const Stream& stream) const { (void)stream; }

  // -------- Output slots --------
  std::size_t output_count() const noexcept { return outputs_.size(); }
  const std::shared_ptr<Stream>& output(std::size_t slot = 0) const;
  const std::vector<std::shared_ptr<Stream>>& outputs() const noexcept { return outputs_; }

  // Metadata carried by an output slot; std::nullopt when unknown.
  virtual std::optional<Meta> output_meta(std::size_t slot) const;

protected:
  // Called by connect() once every input slot is bound.
  virtual void on_inputs_bound() {}

  std::vector<StreamKind> input_kinds_;
  std::vector<Stream*> inputs_;
  std::vector<std::shared_ptr<Stream>> outputs_;

private:
  friend void connect(Stream& source, const std::shared_ptr<Node>& dest,
                      std::optional<std::size_t> slot);
  friend class SplitInserter;
};

} // namespace ffweave
