#include "ffweave/encoding/FFmpeg.h"

#include "ffweave/builder/Stream.h"
#include "ffweave/pipeline/Errors.h"
#include "ffweave/pipeline/internal/Env.h"

#include <iostream>
#include <stdexcept>

namespace ffweave {

FFmpeg::FFmpeg(FFmpegOptions opt) : opt_(std::move(opt)) {
  if (opt_.binary.empty()) throw std::invalid_argument("FFmpeg: binary is empty");
}

std::shared_ptr<Input> FFmpeg::add_input(std::shared_ptr<Input> input) {
  if (!input) throw std::invalid_argument("FFmpeg::add_input: input is null");
  if (input->index_ >= 0) {
    throw std::invalid_argument("FFmpeg::add_input: " + input->file() + " already has index " +
                                std::to_string(input->index_));
  }
  input->index_ = static_cast<int>(inputs_.size());
  inputs_.push_back(input);
  return input;
}

std::shared_ptr<Output> FFmpeg::add_output(std::shared_ptr<Output> output) {
  if (!output) throw std::invalid_argument("FFmpeg::add_output: output is null");
  for (const auto& o : outputs_) {
    if (o == output) throw std::invalid_argument("FFmpeg::add_output: " + output->file() + " added twice");
  }
  outputs_.push_back(output);
  return output;
}

std::vector<std::shared_ptr<Codec>> FFmpeg::codecs() const {
  std::vector<std::shared_ptr<Codec>> out;
  for (const auto& o : outputs_) {
    out.insert(out.end(), o->codecs().begin(), o->codecs().end());
  }
  return out;
}

Stream& FFmpeg::free_source(StreamKind kind) const {
  for (const auto& in : inputs_) {
    for (const auto& s : in->outputs()) {
      if (s->kind() == kind && !s->connected()) return *s;
    }
  }
  throw std::out_of_range(std::string("FFmpeg: no free ") + to_string(kind) + " source stream");
}

RenderedGraph FFmpeg::render_graph() const {
  FilterComplex fc(inputs_, codecs());
  return fc.render();
}

std::vector<std::string> FFmpeg::get_args() const {
  const RenderedGraph graph = render_graph();

  std::vector<std::string> args{opt_.binary};
  if (!opt_.loglevel.empty()) {
    args.push_back("-loglevel");
    args.push_back(opt_.loglevel);
  }
  if (opt_.hide_banner) args.push_back("-hide_banner");
  if (opt_.no_stdin) args.push_back("-nostdin");
  if (opt_.overwrite) args.push_back("-y");

  for (const auto& in : inputs_) {
    const auto a = in->args();
    args.insert(args.end(), a.begin(), a.end());
  }
  if (!graph.text.empty() && !graph.short_form) {
    args.push_back("-filter_complex");
    args.push_back(graph.text);
  }
  for (const auto& o : outputs_) {
    const auto a = o->args(graph);
    args.insert(args.end(), a.begin(), a.end());
  }
  return args;
}

std::string FFmpeg::get_cmd() const {
  return shell_join(get_args());
}

BufferingReport FFmpeg::check_buffering(const BufferingOptions& opt) const {
  return BufferingAnalyzer(opt).analyze(codecs());
}

RunReport FFmpeg::run(ProcessRunner& runner) const {
  RunReport report;
  report.args = get_args();
  report.command_line = shell_join(report.args);

  if (pipeline_internal::env_bool("FFWEAVE_DEBUG_RUN_LOG", false)) {
    std::cerr << "[FFmpeg] run: " << report.command_line << "\n";
  }

  const ProcessResult r = runner.run(report.args);
  report.exit_code = r.exit_code;
  report.error_marker = find_error_marker(r.err, opt_.error_markers);
  report.error_lines = error_lines(r.err, opt_.error_markers);
  report.stdout_tail = tail(r.out, opt_.tail_bytes);
  report.stderr_tail = tail(r.err, opt_.tail_bytes);

  if (r.exit_code != 0 || !report.error_marker.empty()) {
    report.repro_note = "Re-run with: " + report.command_line;
    std::string msg = "ffmpeg failed (exit_code=" + std::to_string(r.exit_code) + ")";
    if (!report.error_marker.empty()) msg += ": " + report.error_marker;
    throw FFmpegError(msg, report);
  }
  return report;
}

RunReport FFmpeg::run() const {
  GlibProcessRunner runner;
  return run(runner);
}

} // namespace ffweave
