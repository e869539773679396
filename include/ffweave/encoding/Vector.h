#pragma once

#include "ffweave/builder/Filter.h"
#include "ffweave/encoding/Codec.h"
#include "ffweave/encoding/FFmpeg.h"

#include <cstddef>
#include <memory>
#include <tuple>
#include <vector>

namespace ffweave {

class Stream;

/**
 * @brief Copies of `filter` for `count` different sources.
 *
 * Element 0 is `filter` itself. Every input already bound to `filter` is
 * rerouted through a Split so that each copy reads the same upstream.
 */
std::vector<std::shared_ptr<Filter>> clone_filter(const std::shared_ptr<Filter>& filter, std::size_t count);

/**
 * @brief Ordered set of parallel streams, one per output variant.
 *
 * Elements may share a Stream. Applying filters groups elements by Stream:
 * one destination is connected directly, several get a Split in between.
 * Masked-out elements pass through unchanged.
 */
class StreamVector final {
public:
  StreamVector(StreamKind kind, std::vector<Stream*> streams);

  StreamKind kind() const noexcept { return kind_; }
  std::size_t size() const noexcept { return streams_.size(); }
  const std::vector<Stream*>& streams() const noexcept { return streams_; }
  Stream& at(std::size_t i) const;

  // Same filter instance for every masked-in element. The instance is cloned
  // when elements hold different streams.
  StreamVector connect(const std::shared_ptr<Filter>& filter, const std::vector<bool>& mask = {}) const;

  // One filter per element; filters with identical parameters are merged per stream.
  // @throws VectorLengthMismatchError
  StreamVector connect_each(const std::vector<std::shared_ptr<Filter>>& filters,
                            const std::vector<bool>& mask = {}) const;

  // Builds F from each params tuple: connect<Scale>(std::vector<std::pair<int, int>>{...}).
  template <class F, class P>
  StreamVector connect(const std::vector<P>& params, const std::vector<bool>& mask = {}) const {
    std::vector<std::shared_ptr<Filter>> filters;
    filters.reserve(params.size());
    for (const auto& p : params) {
      filters.push_back(std::apply([](const auto&... a) { return std::make_shared<F>(a...); }, p));
    }
    return connect_each(filters, mask);
  }

  // Connects element i to codecs[i]. Filter outputs read by several codecs get a Split.
  // @throws VectorLengthMismatchError
  void finalize(const std::vector<std::shared_ptr<Codec>>& codecs) const;

private:
  std::vector<Stream*> apply_(const std::vector<std::shared_ptr<Node>>& dests, bool terminal) const;
  void check_length_(std::size_t n, const char* what) const;

  StreamKind kind_;
  std::vector<Stream*> streams_;
};

/**
 * @brief Program helper for one source encoded into several outputs.
 *
 * video()/audio() return vectors with one element per output. ffmpeg()
 * connects every codec still free to the source's first stream of its kind
 * and returns the program.
 */
class SIMD final {
public:
  SIMD(std::shared_ptr<Input> source, std::vector<std::shared_ptr<Output>> results,
       FFmpegOptions opt = {});

  // Extra inputs (logos, prerolls).
  std::shared_ptr<Input> add_input(std::shared_ptr<Input> input);

  StreamVector video() const { return vector(StreamKind::Video); }
  StreamVector audio() const { return vector(StreamKind::Audio); }
  StreamVector vector(StreamKind kind) const;

  // First codec of a kind in each output.
  std::vector<std::shared_ptr<Codec>> codecs(StreamKind kind) const;

  void finalize(const StreamVector& v) const;

  FFmpeg& ffmpeg();

private:
  std::shared_ptr<Input> source_;
  std::vector<std::shared_ptr<Output>> results_;
  FFmpeg ffmpeg_;
  bool outputs_added_ = false;
};

} // namespace ffweave
