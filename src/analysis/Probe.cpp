#include "ffweave/analysis/Probe.h"

#include "ffweave/pipeline/internal/Env.h"

#include <cmath>
#include <iostream>
#include <stdexcept>

namespace ffweave {

namespace {

// ffprobe prints most numbers as strings.
double number(const nlohmann::json& j, const char* key, double def_val = 0.0) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return def_val;
  if (it->is_number()) return it->get<double>();
  if (it->is_string()) {
    const std::string s = it->get<std::string>();
    if (s.empty() || s == "N/A") return def_val;
    try {
      return std::stod(s);
    } catch (const std::exception&) {
      return def_val;
    }
  }
  return def_val;
}

std::string text(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

// A malformed ratio reads as def_val instead of failing the whole file.
double rational(const nlohmann::json& j, const char* key, double def_val = 0.0) {
  const std::string v = text(j, key);
  if (v.empty()) return def_val;
  try {
    return parse_rational(v);
  } catch (const std::invalid_argument&) {
    if (pipeline_internal::env_bool("FFWEAVE_DEBUG_RUN_LOG", false)) {
      std::cerr << "[Probe] ignoring " << key << "='" << v << "'\n";
    }
    return def_val;
  }
}

double round_to(double v, int digits) {
  const double p = std::pow(10.0, digits);
  return std::round(v * p) / p;
}

Timestamp duration_of(const nlohmann::json& stream, const nlohmann::json& data) {
  double d = number(stream, "duration");
  if (d <= 0.0 && data.contains("format")) d = number(data.at("format"), "duration");
  return Timestamp::from_seconds(d);
}

Meta video_from(const nlohmann::json& s, const nlohmann::json& data) {
  VideoMetaArgs a;
  a.duration = duration_of(s, data);
  a.start = Timestamp::from_seconds(number(s, "start_time"));
  a.bitrate = static_cast<int64_t>(number(s, "bit_rate"));
  a.width = static_cast<int>(number(s, "width"));
  a.height = static_cast<int>(number(s, "height"));

  a.par = round_to(rational(s, "sample_aspect_ratio", 1.0), 3);
  if (a.par <= 0.0) a.par = 1.0;
  a.dar = round_to(rational(s, "display_aspect_ratio"), 3);

  a.frames = static_cast<int64_t>(number(s, "nb_frames"));
  a.frame_rate = rational(s, "r_frame_rate");
  if (a.frame_rate == 0.0) a.frame_rate = rational(s, "avg_frame_rate");
  return video_meta_data(a);
}

Meta audio_from(const nlohmann::json& s, const nlohmann::json& data) {
  AudioMetaArgs a;
  a.duration = duration_of(s, data);
  a.start = Timestamp::from_seconds(number(s, "start_time"));
  a.bitrate = static_cast<int64_t>(number(s, "bit_rate"));
  a.sample_rate = static_cast<int>(number(s, "sample_rate"));
  a.channels = static_cast<int>(number(s, "channels"));
  return audio_meta_data(a);
}

} // namespace

double parse_rational(const std::string& value) {
  if (value.empty()) return 0.0;
  std::size_t sep = value.find(':');
  if (sep == std::string::npos) sep = value.find('/');
  try {
    if (sep == std::string::npos) return std::stod(value);
    const double num = std::stod(value.substr(0, sep));
    const double den = std::stod(value.substr(sep + 1));
    return den == 0.0 ? 0.0 : num / den;
  } catch (const std::exception&) {
    throw std::invalid_argument("parse_rational: malformed value '" + value + "'");
  }
}

std::vector<std::string> probe_args(const std::string& file, const FFmpegOptions& opt) {
  return {opt.probe_binary, "-v", "error", "-show_streams", "-show_format", "-of", "json", "-i", file};
}

std::vector<StreamSpec> streams_from_ffprobe(const nlohmann::json& data) {
  std::vector<StreamSpec> out;
  auto it = data.find("streams");
  if (it == data.end() || !it->is_array()) return out;
  for (const auto& s : *it) {
    const std::string type = text(s, "codec_type");
    if (type == "video") {
      out.push_back({StreamKind::Video, video_from(s, data)});
    } else if (type == "audio") {
      out.push_back({StreamKind::Audio, audio_from(s, data)});
    }
  }
  return out;
}

std::vector<StreamSpec> parse_ffprobe_output(const std::string& text) {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument(std::string("parse_ffprobe_output: ") + e.what());
  }
  return streams_from_ffprobe(data);
}

std::vector<StreamSpec> probe(const std::string& file, ProcessRunner& runner, const FFmpegOptions& opt) {
  const bool log = pipeline_internal::env_bool("FFWEAVE_DEBUG_RUN_LOG", false);
  try {
    const ProcessResult r = runner.run(probe_args(file, opt));
    if (r.exit_code != 0) {
      if (log) std::cerr << "[Probe] " << file << ": exit_code=" << r.exit_code << " " << r.err << "\n";
      return {};
    }
    return parse_ffprobe_output(r.out);
  } catch (const std::exception& e) {
    if (log) std::cerr << "[Probe] " << file << ": " << e.what() << "\n";
    return {};
  }
}

} // namespace ffweave
