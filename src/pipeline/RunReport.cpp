// src/pipeline/RunReport.cpp
#include "ffweave/pipeline/RunReport.h"

#include <nlohmann/json.hpp>

#include <string>

namespace ffweave {

std::string RunReport::to_json() const {
  nlohmann::json j;
  j["args"] = args;
  j["command_line"] = command_line;
  j["exit_code"] = exit_code;
  j["error_marker"] = error_marker;
  j["error_lines"] = error_lines;
  j["stdout_tail"] = stdout_tail;
  j["stderr_tail"] = stderr_tail;
  j["repro_note"] = repro_note;
  // Replace invalid UTF-8 from tool output instead of throwing.
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ffweave
