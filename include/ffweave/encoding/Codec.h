#pragma once

#include "ffweave/builder/Node.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ffweave {

class Output;

struct CodecOptions {
  std::string codec;   // -c:{v|a}:{index}; empty means no -c (stream copy left to ffmpeg)
  int64_t bitrate = 0; // -b:{v|a}:{index}; 0 means unset
  // Extra per-stream options rendered as -{key}:{v|a}:{index} {value}.
  std::vector<std::pair<std::string, std::string>> extra;
};

/**
 * @brief Terminal node: encodes exactly one stream into an Output.
 *
 * The per-kind index inside its Output is assigned when the Output adopts it.
 */
class Codec final : public Node {
public:
  explicit Codec(StreamKind kind, CodecOptions opt = {});

  std::string kind() const override { return "Codec"; }
  std::string user_label() const override;
  NodeRole role() const override { return NodeRole::Codec; }

  StreamKind stream_kind() const noexcept { return kind_; }
  const CodecOptions& options() const noexcept { return opt_; }

  Stream* input_stream() const { return input(0); }
  std::optional<Meta> input_meta() const;

  const Output* output() const noexcept { return output_; }
  int index() const noexcept { return index_; }

  // "v:0"; requires an owning Output.
  std::string specifier() const;
  // "out.mp4:v:0" style name for reports.
  std::string display_name() const;

  // -c / -b / extra tokens (no -map).
  std::vector<std::string> args() const;

private:
  friend class Output;

  StreamKind kind_;
  CodecOptions opt_;
  const Output* output_ = nullptr;
  int index_ = -1;
};

} // namespace ffweave

namespace ffweave::nodes {
std::shared_ptr<ffweave::Codec> VideoCodec(std::string codec = "", int64_t bitrate = 0);
std::shared_ptr<ffweave::Codec> AudioCodec(std::string codec = "", int64_t bitrate = 0);
} // namespace ffweave::nodes
