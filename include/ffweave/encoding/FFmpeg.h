#pragma once

#include "ffweave/analysis/BufferingAnalyzer.h"
#include "ffweave/encoding/FilterComplex.h"
#include "ffweave/encoding/Input.h"
#include "ffweave/encoding/Output.h"
#include "ffweave/pipeline/FFmpegOptions.h"
#include "ffweave/pipeline/RunReport.h"
#include "ffweave/process/ProcessRunner.h"

#include <memory>
#include <string>
#include <vector>

namespace ffweave {

/**
 * @brief The ffmpeg program: owns Inputs and Outputs, renders the argv and runs it.
 *
 * Rendering goes through a fresh FilterComplex every time, so get_args() is
 * repeatable and either returns the whole argv or throws.
 */
class FFmpeg final {
public:
  explicit FFmpeg(FFmpegOptions opt = {});

  const FFmpegOptions& options() const noexcept { return opt_; }

  // Assigns the input index used in stream labels.
  // @throws std::invalid_argument if the input already belongs to a program.
  std::shared_ptr<Input> add_input(std::shared_ptr<Input> input);
  std::shared_ptr<Output> add_output(std::shared_ptr<Output> output);

  const std::vector<std::shared_ptr<Input>>& inputs() const noexcept { return inputs_; }
  const std::vector<std::shared_ptr<Output>>& outputs() const noexcept { return outputs_; }

  // All codecs of all outputs, in output order.
  std::vector<std::shared_ptr<Codec>> codecs() const;

  // First stream of a kind, over all inputs, not yet read by a filter or codec.
  // @throws std::out_of_range when none is left.
  Stream& free_source(StreamKind kind) const;

  RenderedGraph render_graph() const;

  // Full argv, program name first.
  std::vector<std::string> get_args() const;
  std::string get_cmd() const;

  BufferingReport check_buffering(const BufferingOptions& opt = {}) const;

  // Runs the rendered argv. Non-zero exit or an error marker in stderr
  // throws FFmpegError carrying the RunReport.
  RunReport run(ProcessRunner& runner) const;
  RunReport run() const;

private:
  FFmpegOptions opt_;
  std::vector<std::shared_ptr<Input>> inputs_;
  std::vector<std::shared_ptr<Output>> outputs_;
};

} // namespace ffweave
