#pragma once

#include "ffweave/builder/Node.h"
#include "ffweave/media/Meta.h"
#include "ffweave/media/Timestamp.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ffweave {

class Stream;

struct StreamSpec {
  StreamKind kind = StreamKind::Video;
  std::optional<Meta> meta;
};

struct InputOptions {
  std::string format;  // -f before -i
  Timestamp fast_seek; // -ss before -i
  Timestamp duration;  // -t before -i
  Timestamp slow_seek; // -ss after -i
  std::vector<std::pair<std::string, std::string>> extra; // -{key} {value} before -i
};

/**
 * @brief Source node: one input file and its typed streams.
 *
 * Scenes without a stream id get "{file}#{index}". The input index used in
 * labels is assigned by FFmpeg::add_input.
 */
class Input final : public Node {
public:
  Input(std::string file, std::vector<StreamSpec> streams, InputOptions opt = {});

  std::string kind() const override { return "Input"; }
  std::string user_label() const override { return file_; }
  NodeRole role() const override { return NodeRole::Source; }

  std::optional<Meta> output_meta(std::size_t slot) const override;

  const std::string& file() const noexcept { return file_; }
  const InputOptions& options() const noexcept { return opt_; }

  // -1 until added to a program.
  int index() const noexcept { return index_; }

  // n-th stream of a kind. @throws std::out_of_range
  Stream& stream(StreamKind kind, std::size_t n = 0) const;
  Stream& video(std::size_t n = 0) const { return stream(StreamKind::Video, n); }
  Stream& audio(std::size_t n = 0) const { return stream(StreamKind::Audio, n); }
  std::size_t count(StreamKind kind) const noexcept;

  // "0:v", "0:a:1". @throws UnresolvedReferenceError when not added to a program.
  std::string stream_label(std::size_t slot) const;

  std::vector<std::string> args() const;

private:
  friend class FFmpeg;

  static std::vector<StreamKind> kinds_of_(const std::vector<StreamSpec>& streams);

  std::string file_;
  InputOptions opt_;
  int index_ = -1;
};

// Convenience factory.
std::shared_ptr<Input> input_file(std::string file, std::vector<StreamSpec> streams,
                                  InputOptions opt = {});

} // namespace ffweave
