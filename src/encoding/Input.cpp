#include "ffweave/encoding/Input.h"

#include "ffweave/builder/Stream.h"
#include "ffweave/pipeline/Errors.h"

#include <stdexcept>

namespace ffweave {

std::vector<StreamKind> Input::kinds_of_(const std::vector<StreamSpec>& streams) {
  std::vector<StreamKind> kinds;
  kinds.reserve(streams.size());
  for (const auto& s : streams) kinds.push_back(s.kind);
  return kinds;
}

Input::Input(std::string file, std::vector<StreamSpec> streams, InputOptions opt)
  : Node({}, kinds_of_(streams)), file_(std::move(file)), opt_(std::move(opt)) {
  if (file_.empty()) throw std::invalid_argument("Input: file name is empty");

  for (std::size_t i = 0; i < streams.size(); ++i) {
    auto& meta = streams[i].meta;
    if (meta) {
      if (meta->kind != streams[i].kind) {
        throw std::invalid_argument("Input(" + file_ + "): stream " + std::to_string(i) +
                                    " declared " + to_string(streams[i].kind) +
                                    " but metadata is " + to_string(meta->kind));
      }
      const std::string id = file_ + "#" + std::to_string(i);
      for (auto& sc : meta->scenes) {
        if (sc.stream.empty()) sc.stream = id;
      }
      if (meta->streams.empty()) meta->streams.push_back(id);
    }
    outputs_[i]->set_meta(std::move(meta));
  }
}

std::optional<Meta> Input::output_meta(std::size_t slot) const {
  return output(slot)->own_meta();
}

Stream& Input::stream(StreamKind kind, std::size_t n) const {
  std::size_t seen = 0;
  for (const auto& s : outputs_) {
    if (s->kind() != kind) continue;
    if (seen == n) return *s;
    ++seen;
  }
  throw std::out_of_range("Input(" + file_ + "): no " + to_string(kind) + " stream #" +
                          std::to_string(n));
}

std::size_t Input::count(StreamKind kind) const noexcept {
  std::size_t n = 0;
  for (const auto& s : outputs_) {
    if (s->kind() == kind) ++n;
  }
  return n;
}

std::string Input::stream_label(std::size_t slot) const {
  if (index_ < 0) {
    throw UnresolvedReferenceError("Input(" + file_ + ") is not part of the program");
  }
  const StreamKind k = output(slot)->kind();
  std::size_t nth = 0;
  for (std::size_t i = 0; i < slot; ++i) {
    if (outputs_[i]->kind() == k) ++nth;
  }
  std::string label = std::to_string(index_) + ":" + kind_tag(k);
  if (nth > 0) label += ":" + std::to_string(nth);
  return label;
}

std::vector<std::string> Input::args() const {
  std::vector<std::string> out;
  if (!opt_.format.empty()) {
    out.push_back("-f");
    out.push_back(opt_.format);
  }
  if (!opt_.fast_seek.is_zero()) {
    out.push_back("-ss");
    out.push_back(opt_.fast_seek.to_string());
  }
  if (!opt_.duration.is_zero()) {
    out.push_back("-t");
    out.push_back(opt_.duration.to_string());
  }
  for (const auto& kv : opt_.extra) {
    out.push_back("-" + kv.first);
    if (!kv.second.empty()) out.push_back(kv.second);
  }
  out.push_back("-i");
  out.push_back(file_);
  if (!opt_.slow_seek.is_zero()) {
    out.push_back("-ss");
    out.push_back(opt_.slow_seek.to_string());
  }
  return out;
}

std::shared_ptr<Input> input_file(std::string file, std::vector<StreamSpec> streams,
                                  InputOptions opt) {
  return std::make_shared<Input>(std::move(file), std::move(streams), std::move(opt));
}

} // namespace ffweave
