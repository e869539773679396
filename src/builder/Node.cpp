// src/builder/Node.cpp
#include "ffweave/builder/Node.h"

#include "ffweave/builder/Stream.h"
#include "ffweave/pipeline/Errors.h"

#include <stdexcept>
#include <string>

namespace ffweave {

Node::Node(std::vector<StreamKind> input_kinds, std::vector<StreamKind> output_kinds)
  : input_kinds_(std::move(input_kinds)),
    inputs_(input_kinds_.size(), nullptr) {
  outputs_.reserve(output_kinds.size());
  for (std::size_t i = 0; i < output_kinds.size(); ++i) {
    outputs_.push_back(std::make_shared<Stream>(this, i, output_kinds[i]));
  }
}

StreamKind Node::input_kind(std::size_t slot) const {
  if (slot >= input_kinds_.size()) {
    throw std::out_of_range(kind() + ": invalid input slot " + std::to_string(slot));
  }
  return input_kinds_[slot];
}

Stream* Node::input(std::size_t slot) const {
  if (slot >= inputs_.size()) {
    throw std::out_of_range(kind() + ": invalid input slot " + std::to_string(slot));
  }
  return inputs_[slot];
}

bool Node::inputs_bound() const noexcept {
  for (Stream* s : inputs_) {
    if (!s) return false;
  }
  return true;
}

std::optional<std::size_t> Node::first_free_slot() const noexcept {
  for (std::size_t i = 0; i < inputs_.size(); ++i) {
    if (!inputs_[i]) return i;
  }
  return std::nullopt;
}

void Node::check_input(std::size_t slot, const Stream& stream) const {
  if (slot >= inputs_.size()) {
    throw ConnectionError(kind() + ": input slot " + std::to_string(slot) + " does not exist (" +
                          std::to_string(inputs_.size()) + " declared)");
  }
  if (inputs_[slot]) {
    throw ConnectionError(kind() + ": input slot " + std::to_string(slot) + " is already bound");
  }
  if (input_kinds_[slot] != stream.kind()) {
    throw ConnectionError(kind() + ": input slot " + std::to_string(slot) + " expects " +
                          to_string(input_kinds_[slot]) + ", got " + to_string(stream.kind()));
  }
}

const std::shared_ptr<Stream>& Node::output(std::size_t slot) const {
  if (slot >= outputs_.size()) {
    throw std::out_of_range(kind() + ": invalid output slot " + std::to_string(slot));
  }
  return outputs_[slot];
}

std::optional<Meta> Node::output_meta(std::size_t slot) const {
  (void)slot;
  return std::nullopt;
}

} // namespace ffweave
