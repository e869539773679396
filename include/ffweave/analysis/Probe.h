#pragma once

#include "ffweave/encoding/Input.h"
#include "ffweave/pipeline/FFmpegOptions.h"
#include "ffweave/process/ProcessRunner.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ffweave {

// ffprobe -v error -show_streams -show_format -of json -i {file}
std::vector<std::string> probe_args(const std::string& file, const FFmpegOptions& opt = {});

// Video and audio streams of an ffprobe JSON document, in file order.
// Other stream types are skipped.
std::vector<StreamSpec> streams_from_ffprobe(const nlohmann::json& data);

// @throws std::invalid_argument when `text` is not valid JSON.
std::vector<StreamSpec> parse_ffprobe_output(const std::string& text);

// Runs ffprobe. Any failure (spawn, exit code, bad output) yields an empty list.
std::vector<StreamSpec> probe(const std::string& file, ProcessRunner& runner,
                              const FFmpegOptions& opt = {});

// "16:9", "30000/1001", "1.5"; zero denominators give 0.
double parse_rational(const std::string& text);

} // namespace ffweave
