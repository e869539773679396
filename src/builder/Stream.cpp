// src/builder/Stream.cpp
#include "ffweave/builder/Stream.h"

#include "ffweave/pipeline/Errors.h"

#include <sstream>

namespace ffweave {

Stream::Stream(Node* owner, std::size_t slot, StreamKind kind, std::optional<Meta> meta)
  : owner_(owner), slot_(slot), kind_(kind), meta_(std::move(meta)) {}

std::optional<Meta> Stream::meta() const {
  if (!owner_ || owner_->role() == NodeRole::Source) return meta_;
  return owner_->output_meta(slot_);
}

Node* Stream::filter_dest() const noexcept {
  for (const auto& d : dests_) {
    if (d && d->role() == NodeRole::Filter) return d.get();
  }
  return nullptr;
}

std::string Stream::describe() const {
  std::ostringstream oss;
  oss << (owner_ ? owner_->kind() : std::string("<detached>")) << "#" << slot_ << ":"
      << kind_tag(kind_);
  return oss.str();
}

void connect(Stream& source, const std::shared_ptr<Node>& dest, std::optional<std::size_t> slot) {
  if (!dest) throw ConnectionError("connect: destination is null");

  const bool to_filter = dest->role() == NodeRole::Filter;
  if (dest->role() == NodeRole::Source) {
    throw ConnectionError("connect: " + dest->kind() + " has no inputs");
  }
  if (source.is_source()) {
    // Codecs are terminal; only a second Filter reader violates single use.
    if (to_filter && source.filter_dest()) {
      throw ConnectionError("connect: " + source.describe() + " already feeds " +
                            source.filter_dest()->kind() + "; insert a Split");
    }
  } else if (source.connected()) {
    throw ConnectionError("connect: " + source.describe() + " already feeds " +
                          source.dests_.front()->kind());
  }
  for (const auto& d : source.dests_) {
    if (d == dest) {
      throw ConnectionError("connect: " + source.describe() + " already feeds this " + dest->kind());
    }
  }

  std::size_t target = 0;
  if (slot) {
    target = *slot;
  } else {
    auto free_slot = dest->first_free_slot();
    if (!free_slot) {
      throw ConnectionError("connect: all input slots of " + dest->kind() + " are bound");
    }
    target = *free_slot;
  }
  dest->check_input(target, source);

  dest->inputs_[target] = &source;
  source.dests_.push_back(dest);

  if (dest->inputs_bound()) dest->on_inputs_bound();
}

std::size_t pipe(Stream& source, const std::shared_ptr<Node>& dest) {
  if (!dest) throw ConnectionError("pipe: destination is null");
  for (std::size_t i = 0; i < dest->input_count(); ++i) {
    if (dest->input(i) || dest->input_kind(i) != source.kind()) continue;
    connect(source, dest, i);
    return i;
  }
  dest->check_kind(source);
  throw NoFreeSlotError("pipe: " + dest->kind() + " has no free " + to_string(source.kind()) +
                        " input for " + source.describe());
}

} // namespace ffweave
