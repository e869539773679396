#pragma once

#include <string>
#include <vector>

namespace ffweave {

struct RunReport {
  std::vector<std::string> args; // argv including the program name
  std::string command_line;      // shell-quoted argv for repro

  int exit_code = -1;
  std::string error_marker; // first failure marker found in stderr, if any
  std::vector<std::string> error_lines;

  // Tails of captured output (bounded).
  std::string stdout_tail;
  std::string stderr_tail;

  std::string repro_note;

  // Optional: JSON serialization for CI / support bundling
  std::string to_json() const;
};

} // namespace ffweave
