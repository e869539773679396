#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace ffweave {

// Markers that make a run fail even with a zero exit code.
std::vector<std::string> default_error_markers();

struct FFmpegOptions {
  std::string binary = "ffmpeg";
  std::string probe_binary = "ffprobe";

  // Global flags.
  std::string loglevel;  // -loglevel; empty leaves ffmpeg's default
  bool overwrite = false; // -y
  bool hide_banner = false;
  bool no_stdin = false;

  std::vector<std::string> error_markers = default_error_markers();
  std::size_t tail_bytes = 4096; // stdout/stderr kept in RunReport
};

// FFWEAVE_FFMPEG_BIN, FFWEAVE_FFPROBE_BIN, FFWEAVE_LOGLEVEL and
// FFWEAVE_TAIL_BYTES override `base`.
FFmpegOptions options_from_env(FFmpegOptions base = {});

// Keys: binary, probe_binary, loglevel, overwrite, hide_banner, no_stdin,
// error_markers, tail_bytes. Missing keys keep `base`.
// @throws std::invalid_argument on a non-object or a mistyped value.
FFmpegOptions options_from_json(const nlohmann::json& j, FFmpegOptions base = {});

} // namespace ffweave
