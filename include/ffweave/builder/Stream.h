#pragma once

#include "ffweave/builder/Node.h"
#include "ffweave/media/Meta.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ffweave {

/**
 * @brief Edge of the filter graph: one output slot of a Source or a Filter.
 *
 * Ownership runs downstream: a Stream keeps its destinations alive, a Node
 * keeps its output Streams alive. Back references (owner, Node inputs) are raw.
 *
 * Consumption rules:
 *  - a Source stream feeds at most one Filter and any number of Codecs
 *  - a Filter output feeds exactly one Filter or Codec
 * Binding is final.
 */
class Stream final {
public:
  Stream(Node* owner, std::size_t slot, StreamKind kind, std::optional<Meta> meta = std::nullopt);

  StreamKind kind() const noexcept { return kind_; }
  Node* owner() const noexcept { return owner_; }
  std::size_t slot() const noexcept { return slot_; }

  bool is_source() const { return owner_ && owner_->role() == NodeRole::Source; }

  // Own metadata for Source streams, propagated metadata for Filter outputs.
  std::optional<Meta> meta() const;
  const std::optional<Meta>& own_meta() const noexcept { return meta_; }
  void set_meta(std::optional<Meta> meta) { meta_ = std::move(meta); }

  const std::vector<std::shared_ptr<Node>>& dests() const noexcept { return dests_; }
  bool connected() const noexcept { return !dests_.empty(); }
  // The Filter reading this stream, if any.
  Node* filter_dest() const noexcept;

  // Connect to the first free compatible slot of `dest`. Returns `dest`.
  template <class T>
  std::shared_ptr<T> pipe(std::shared_ptr<T> dest);

  std::string describe() const;

private:
  friend void connect(Stream& source, const std::shared_ptr<Node>& dest,
                      std::optional<std::size_t> slot);
  friend class SplitInserter;

  Node* owner_ = nullptr;
  std::size_t slot_ = 0;
  StreamKind kind_ = StreamKind::Video;
  std::optional<Meta> meta_;
  std::vector<std::shared_ptr<Node>> dests_;
};

} // namespace ffweave

#include "ffweave/builder/Connect.h"

namespace ffweave {

template <class T>
std::shared_ptr<T> Stream::pipe(std::shared_ptr<T> dest) {
  ffweave::pipe(*this, dest);
  return dest;
}

} // namespace ffweave
