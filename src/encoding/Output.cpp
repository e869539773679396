#include "ffweave/encoding/Output.h"

#include "ffweave/encoding/FilterComplex.h"

#include <stdexcept>

namespace ffweave {

Output::Output(std::string file, std::vector<std::shared_ptr<Codec>> codecs, OutputOptions opt)
  : file_(std::move(file)), opt_(std::move(opt)) {
  if (file_.empty()) throw std::invalid_argument("Output: file name is empty");
  for (auto& c : codecs) add_codec(std::move(c));
}

Codec& Output::add_codec(std::shared_ptr<Codec> codec) {
  if (!codec) throw std::invalid_argument("Output(" + file_ + "): codec is null");
  if (codec->output_) {
    throw std::invalid_argument("Output(" + file_ + "): codec already belongs to " +
                                codec->output_->file());
  }
  int index = 0;
  for (const auto& c : codecs_) {
    if (c->stream_kind() == codec->stream_kind()) ++index;
  }
  codec->output_ = this;
  codec->index_ = index;
  codecs_.push_back(std::move(codec));
  return *codecs_.back();
}

std::shared_ptr<Codec> Output::codec(StreamKind kind) {
  for (const auto& c : codecs_) {
    if (c->stream_kind() == kind && !c->input_stream()) return c;
  }
  auto stub = std::make_shared<Codec>(kind);
  add_codec(stub);
  return stub;
}

std::vector<std::string> Output::args(const RenderedGraph& graph) const {
  std::vector<std::string> out;
  bool has_video = false;
  bool has_audio = false;

  for (const auto& c : codecs_) {
    (c->stream_kind() == StreamKind::Video ? has_video : has_audio) = true;
    out.push_back("-map");
    out.push_back(graph.map_for(*c));
    if (graph.short_form && graph.chain_codec == c.get()) {
      out.push_back("-filter:" + c->specifier());
      out.push_back(graph.text);
    }
    const auto codec_args = c->args();
    out.insert(out.end(), codec_args.begin(), codec_args.end());
  }

  if (!opt_.format.empty()) {
    out.push_back("-f");
    out.push_back(opt_.format);
  }
  if (!has_video) out.push_back("-vn");
  if (!has_audio) out.push_back("-an");
  for (const auto& kv : opt_.extra) {
    out.push_back("-" + kv.first);
    if (!kv.second.empty()) out.push_back(kv.second);
  }
  out.push_back(file_);
  return out;
}

std::shared_ptr<Output> output_file(std::string file, std::vector<std::shared_ptr<Codec>> codecs,
                                    OutputOptions opt) {
  return std::make_shared<Output>(std::move(file), std::move(codecs), std::move(opt));
}

} // namespace ffweave
