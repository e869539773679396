#pragma once

#include "ffweave/encoding/Codec.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ffweave {

struct RenderedGraph;

struct OutputOptions {
  std::string format; // -f
  // Container options rendered as -{key} {value} before the file name.
  std::vector<std::pair<std::string, std::string>> extra;
};

/**
 * @brief Output file: owns its codecs and container options.
 *
 * -vn / -an are added when the output has no codec of that kind.
 */
class Output final {
public:
  Output(std::string file, std::vector<std::shared_ptr<Codec>> codecs = {}, OutputOptions opt = {});

  Output(const Output&) = delete;
  Output& operator=(const Output&) = delete;

  const std::string& file() const noexcept { return file_; }
  const OutputOptions& options() const noexcept { return opt_; }
  const std::vector<std::shared_ptr<Codec>>& codecs() const noexcept { return codecs_; }

  // Adopt a codec and assign its per-kind index.
  // @throws std::invalid_argument if the codec already belongs to an Output.
  Codec& add_codec(std::shared_ptr<Codec> codec);

  // First codec of a kind with a free input; adds a stub codec when none is free.
  std::shared_ptr<Codec> codec(StreamKind kind);
  std::shared_ptr<Codec> video() { return codec(StreamKind::Video); }
  std::shared_ptr<Codec> audio() { return codec(StreamKind::Audio); }

  std::vector<std::string> args(const RenderedGraph& graph) const;

private:
  std::string file_;
  OutputOptions opt_;
  std::vector<std::shared_ptr<Codec>> codecs_;
};

std::shared_ptr<Output> output_file(std::string file, std::vector<std::shared_ptr<Codec>> codecs = {},
                                    OutputOptions opt = {});

} // namespace ffweave
