#include "ffweave/encoding/Vector.h"

#include "ffweave/builder/Stream.h"
#include "ffweave/nodes/common/Split.h"
#include "ffweave/pipeline/Errors.h"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <utility>

namespace ffweave {

std::vector<std::shared_ptr<Filter>> clone_filter(const std::shared_ptr<Filter>& filter, std::size_t count) {
  if (!filter) throw std::invalid_argument("clone_filter: filter is null");
  if (count == 0) throw std::invalid_argument("clone_filter: count must be >= 1");

  std::vector<std::shared_ptr<Filter>> out{filter};
  if (count == 1) return out;
  for (std::size_t k = 1; k < count; ++k) out.push_back(filter->clone());

  for (std::size_t slot = 0; slot < filter->input_count(); ++slot) {
    Stream* s = filter->input(slot);
    if (!s) continue;
    auto split = SplitInserter::insert(*s, static_cast<int>(count));
    for (std::size_t k = 1; k < count; ++k) {
      connect(*split->output(k), out[k], slot);
    }
  }
  return out;
}

StreamVector::StreamVector(StreamKind kind, std::vector<Stream*> streams)
  : kind_(kind), streams_(std::move(streams)) {
  if (streams_.empty()) throw std::invalid_argument("StreamVector: no streams");
  for (Stream* s : streams_) {
    if (!s) throw std::invalid_argument("StreamVector: null stream");
    if (s->kind() != kind_) {
      throw std::invalid_argument("StreamVector: " + s->describe() + " is not " + to_string(kind_));
    }
  }
}

Stream& StreamVector::at(std::size_t i) const {
  if (i >= streams_.size()) throw std::out_of_range("StreamVector::at: index out of range");
  return *streams_[i];
}

void StreamVector::check_length_(std::size_t n, const char* what) const {
  if (n != streams_.size()) {
    throw VectorLengthMismatchError(std::string("StreamVector: ") + std::to_string(n) + " " + what +
                                    " for " + std::to_string(streams_.size()) + " streams");
  }
}

StreamVector StreamVector::connect(const std::shared_ptr<Filter>& filter, const std::vector<bool>& mask) const {
  if (!filter) throw std::invalid_argument("StreamVector::connect: filter is null");
  if (!mask.empty()) check_length_(mask.size(), "mask values");

  std::vector<std::shared_ptr<Node>> dests(streams_.size());
  for (std::size_t i = 0; i < streams_.size(); ++i) {
    if (mask.empty() || mask[i]) dests[i] = filter;
  }
  return StreamVector(filter->outputs().front()->kind(), apply_(dests, false));
}

StreamVector StreamVector::connect_each(const std::vector<std::shared_ptr<Filter>>& filters,
                                        const std::vector<bool>& mask) const {
  check_length_(filters.size(), "filters");
  if (!mask.empty()) check_length_(mask.size(), "mask values");

  std::vector<std::shared_ptr<Node>> dests(streams_.size());
  StreamKind out_kind = kind_;
  for (std::size_t i = 0; i < streams_.size(); ++i) {
    if (!mask.empty() && !mask[i]) continue;
    if (!filters[i]) throw std::invalid_argument("StreamVector::connect_each: null filter");
    out_kind = filters[i]->outputs().front()->kind();
    dests[i] = filters[i];
    // Equal parameters on the same stream share one filter.
    for (std::size_t j = 0; j < i; ++j) {
      if (!dests[j] || streams_[j] != streams_[i]) continue;
      if (static_cast<const Filter&>(*dests[j]).same_as(*filters[i])) {
        dests[i] = dests[j];
        break;
      }
    }
  }
  return StreamVector(out_kind, apply_(dests, false));
}

void StreamVector::finalize(const std::vector<std::shared_ptr<Codec>>& codecs) const {
  check_length_(codecs.size(), "codecs");
  std::vector<std::shared_ptr<Node>> dests;
  dests.reserve(codecs.size());
  for (const auto& c : codecs) {
    if (!c) throw std::invalid_argument("StreamVector::finalize: null codec");
    dests.push_back(c);
  }
  (void)apply_(dests, true);
}

std::vector<Stream*> StreamVector::apply_(const std::vector<std::shared_ptr<Node>>& dests,
                                          bool terminal) const {
  check_length_(dests.size(), "destinations");

  std::vector<Stream*> sources;
  for (Stream* s : streams_) {
    if (std::find(sources.begin(), sources.end(), s) == sources.end()) sources.push_back(s);
  }

  // A filter instance requested by several streams is cloned, one copy per stream.
  std::vector<std::pair<Node*, std::vector<Stream*>>> users;
  for (std::size_t i = 0; i < dests.size(); ++i) {
    if (!dests[i]) continue;
    auto it = std::find_if(users.begin(), users.end(),
                           [&](const auto& u) { return u.first == dests[i].get(); });
    if (it == users.end()) {
      users.push_back({dests[i].get(), {}});
      it = users.end() - 1;
    }
    if (std::find(it->second.begin(), it->second.end(), streams_[i]) == it->second.end()) {
      it->second.push_back(streams_[i]);
    }
  }

  std::map<std::pair<const Stream*, const Node*>, std::shared_ptr<Node>> routed;
  for (const auto& u : users) {
    std::shared_ptr<Node> shared;
    for (const auto& d : dests) {
      if (d.get() == u.first) shared = d;
    }
    if (terminal || u.second.size() == 1) {
      for (Stream* s : u.second) routed[{s, u.first}] = shared;
      continue;
    }
    auto copies = clone_filter(std::static_pointer_cast<Filter>(shared), u.second.size());
    for (std::size_t k = 0; k < u.second.size(); ++k) routed[{u.second[k], u.first}] = copies[k];
  }

  std::vector<Stream*> result(streams_.size(), nullptr);
  for (Stream* src : sources) {
    std::vector<std::shared_ptr<Node>> targets;
    bool has_passthrough = false;
    for (std::size_t i = 0; i < streams_.size(); ++i) {
      if (streams_[i] != src) continue;
      if (!dests[i]) {
        has_passthrough = true;
        continue;
      }
      const auto& t = routed.at({src, dests[i].get()});
      if (std::find(targets.begin(), targets.end(), t) == targets.end()) targets.push_back(t);
    }

    Stream* passthrough = src;
    const std::size_t fanout = targets.size() + (has_passthrough ? 1 : 0);
    if (fanout == 1 || (terminal && src->is_source())) {
      for (const auto& t : targets) pipe(*src, t);
    } else {
      auto split = std::make_shared<Split>(kind_, static_cast<int>(fanout));
      pipe(*src, split);
      for (std::size_t k = 0; k < targets.size(); ++k) pipe(*split->output(k), targets[k]);
      if (has_passthrough) passthrough = split->output(targets.size()).get();
    }

    for (std::size_t i = 0; i < streams_.size(); ++i) {
      if (streams_[i] != src) continue;
      if (!dests[i]) {
        result[i] = passthrough;
      } else if (!terminal) {
        result[i] = routed.at({src, dests[i].get()})->output(0).get();
      }
    }
  }
  return result;
}

SIMD::SIMD(std::shared_ptr<Input> source, std::vector<std::shared_ptr<Output>> results, FFmpegOptions opt)
  : source_(std::move(source)), results_(std::move(results)), ffmpeg_(std::move(opt)) {
  if (!source_) throw std::invalid_argument("SIMD: source is null");
  if (source_->output_count() == 0) throw std::invalid_argument("SIMD: source has no streams");
  if (results_.empty()) throw std::invalid_argument("SIMD: no outputs");
  for (const auto& o : results_) {
    if (!o || o->codecs().empty()) throw std::invalid_argument("SIMD: every output needs codecs");
  }
  ffmpeg_.add_input(source_);
}

std::shared_ptr<Input> SIMD::add_input(std::shared_ptr<Input> input) {
  return ffmpeg_.add_input(std::move(input));
}

StreamVector SIMD::vector(StreamKind kind) const {
  Stream& s = source_->stream(kind);
  return StreamVector(kind, std::vector<Stream*>(results_.size(), &s));
}

std::vector<std::shared_ptr<Codec>> SIMD::codecs(StreamKind kind) const {
  std::vector<std::shared_ptr<Codec>> out;
  for (const auto& o : results_) {
    auto it = std::find_if(o->codecs().begin(), o->codecs().end(),
                           [&](const std::shared_ptr<Codec>& c) { return c->stream_kind() == kind; });
    if (it == o->codecs().end()) {
      throw std::invalid_argument("SIMD: " + o->file() + " has no " + to_string(kind) + " codec");
    }
    out.push_back(*it);
  }
  return out;
}

void SIMD::finalize(const StreamVector& v) const {
  v.finalize(codecs(v.kind()));
}

FFmpeg& SIMD::ffmpeg() {
  if (outputs_added_) return ffmpeg_;
  for (StreamKind kind : {StreamKind::Video, StreamKind::Audio}) {
    if (source_->count(kind) == 0) continue;
    Stream& s = source_->stream(kind);
    for (const auto& o : results_) {
      for (const auto& c : o->codecs()) {
        if (c->stream_kind() == kind && !c->input_stream()) ffweave::connect(s, c);
      }
    }
  }
  for (const auto& o : results_) ffmpeg_.add_output(o);
  outputs_added_ = true;
  return ffmpeg_;
}

} // namespace ffweave
