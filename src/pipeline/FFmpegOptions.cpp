#include "ffweave/pipeline/FFmpegOptions.h"

#include "ffweave/pipeline/internal/Env.h"

#include <stdexcept>

namespace ffweave {

std::vector<std::string> default_error_markers() {
  return {
      "Conversion failed!",
      "Error while processing",
      "Error initializing",
      "Error opening",
      "Invalid argument",
      "No such file or directory",
  };
}

FFmpegOptions options_from_env(FFmpegOptions base) {
  using pipeline_internal::env_str;
  base.binary = env_str("FFWEAVE_FFMPEG_BIN", base.binary);
  base.probe_binary = env_str("FFWEAVE_FFPROBE_BIN", base.probe_binary);
  base.loglevel = env_str("FFWEAVE_LOGLEVEL", base.loglevel);
  const int tail_bytes = pipeline_internal::env_int("FFWEAVE_TAIL_BYTES", -1);
  if (tail_bytes > 0) base.tail_bytes = static_cast<std::size_t>(tail_bytes);
  return base;
}

FFmpegOptions options_from_json(const nlohmann::json& j, FFmpegOptions base) {
  if (!j.is_object()) throw std::invalid_argument("options_from_json: expected a JSON object");
  try {
    if (j.contains("binary")) base.binary = j.at("binary").get<std::string>();
    if (j.contains("probe_binary")) base.probe_binary = j.at("probe_binary").get<std::string>();
    if (j.contains("loglevel")) base.loglevel = j.at("loglevel").get<std::string>();
    if (j.contains("overwrite")) base.overwrite = j.at("overwrite").get<bool>();
    if (j.contains("hide_banner")) base.hide_banner = j.at("hide_banner").get<bool>();
    if (j.contains("no_stdin")) base.no_stdin = j.at("no_stdin").get<bool>();
    if (j.contains("error_markers")) {
      base.error_markers = j.at("error_markers").get<std::vector<std::string>>();
    }
    if (j.contains("tail_bytes")) base.tail_bytes = j.at("tail_bytes").get<std::size_t>();
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("options_from_json: ") + e.what());
  }
  if (base.binary.empty()) throw std::invalid_argument("options_from_json: binary is empty");
  return base;
}

} // namespace ffweave
