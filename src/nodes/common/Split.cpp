#include "ffweave/nodes/common/Split.h"

#include "ffweave/builder/Stream.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ffweave {

Split::Split(StreamKind kind, int output_count)
  : Filter({kind}, std::vector<StreamKind>(output_count > 0 ? output_count : 0, kind)),
    kind_(kind),
    output_count_(output_count) {
  if (output_count < 1) {
    throw std::invalid_argument("Split: output_count must be >= 1, got " +
                                std::to_string(output_count));
  }
}

std::string Split::filter_name() const {
  return kind_ == StreamKind::Video ? "split" : "asplit";
}

std::vector<FilterParam> Split::params() const {
  // Two outputs is ffmpeg's default.
  if (output_count_ == 2) return {};
  return {{"", static_cast<int64_t>(output_count_)}};
}

std::shared_ptr<Filter> Split::clone() const {
  return std::make_shared<Split>(kind_, output_count_);
}

std::shared_ptr<Split> SplitInserter::insert(Stream& source, int output_count) {
  auto split = std::make_shared<Split>(source.kind(), output_count);

  std::shared_ptr<Node> reader;
  if (source.is_source()) {
    for (const auto& d : source.dests_) {
      if (d->role() == NodeRole::Filter) reader = d;
    }
  } else if (!source.dests_.empty()) {
    reader = source.dests_.front();
  }

  if (!reader) {
    connect(source, split, 0);
    return split;
  }

  std::size_t reader_slot = reader->inputs_.size();
  for (std::size_t i = 0; i < reader->inputs_.size(); ++i) {
    if (reader->inputs_[i] == &source) reader_slot = i;
  }
  if (reader_slot == reader->inputs_.size()) {
    throw std::logic_error("SplitInserter: " + source.describe() + " is not bound to its reader");
  }

  auto& dests = source.dests_;
  dests.erase(std::remove(dests.begin(), dests.end(), reader), dests.end());
  connect(source, split, 0);

  Stream& head = *split->output(0);
  reader->inputs_[reader_slot] = &head;
  head.dests_.push_back(reader);
  return split;
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Split> Split(StreamKind kind, int output_count) {
  return std::make_shared<ffweave::Split>(kind, output_count);
}

} // namespace ffweave::nodes
