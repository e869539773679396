#include "ffweave/encoding/Codec.h"

#include "ffweave/builder/Stream.h"
#include "ffweave/encoding/Output.h"
#include "ffweave/pipeline/Errors.h"

#include <stdexcept>

namespace ffweave {

Codec::Codec(StreamKind kind, CodecOptions opt)
  : Node({kind}, {}), kind_(kind), opt_(std::move(opt)) {
  for (const auto& kv : opt_.extra) {
    if (kv.first.empty()) throw std::invalid_argument("Codec: extra option with empty key");
  }
}

std::string Codec::user_label() const {
  return opt_.codec.empty() ? std::string("<stub>") : opt_.codec;
}

std::optional<Meta> Codec::input_meta() const {
  Stream* s = input_stream();
  if (!s) return std::nullopt;
  return s->meta();
}

std::string Codec::specifier() const {
  if (!output_ || index_ < 0) {
    throw UnresolvedReferenceError("Codec(" + user_label() + ") does not belong to an Output");
  }
  return std::string(kind_tag(kind_)) + ":" + std::to_string(index_);
}

std::string Codec::display_name() const {
  const std::string file = output_ ? output_->file() : std::string("<no output>");
  if (index_ < 0) return file + ":" + kind_tag(kind_);
  return file + ":" + kind_tag(kind_) + ":" + std::to_string(index_);
}

std::vector<std::string> Codec::args() const {
  const std::string spec = specifier();
  std::vector<std::string> out;
  if (!opt_.codec.empty()) {
    out.push_back("-c:" + spec);
    out.push_back(opt_.codec);
  }
  if (opt_.bitrate > 0) {
    out.push_back("-b:" + spec);
    out.push_back(std::to_string(opt_.bitrate));
  }
  for (const auto& kv : opt_.extra) {
    out.push_back("-" + kv.first + ":" + spec);
    out.push_back(kv.second);
  }
  return out;
}

} // namespace ffweave

namespace ffweave::nodes {

std::shared_ptr<ffweave::Codec> VideoCodec(std::string codec, int64_t bitrate) {
  CodecOptions opt;
  opt.codec = std::move(codec);
  opt.bitrate = bitrate;
  return std::make_shared<ffweave::Codec>(StreamKind::Video, std::move(opt));
}

std::shared_ptr<ffweave::Codec> AudioCodec(std::string codec, int64_t bitrate) {
  CodecOptions opt;
  opt.codec = std::move(codec);
  opt.bitrate = bitrate;
  return std::make_shared<ffweave::Codec>(StreamKind::Audio, std::move(opt));
}

} // namespace ffweave::nodes
