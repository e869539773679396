#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ffweave {

struct ProcessResult {
  int exit_code = -1; // -1 when the child did not exit normally
  std::string out;
  std::string err;
};

// Runs a fully rendered argv (argv[0] is the program) and waits for it.
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;
  // @throws std::runtime_error when the process can't be started.
  virtual ProcessResult run(const std::vector<std::string>& argv) = 0;
};

// GLib implementation: g_spawn_sync with PATH lookup, stdout/stderr captured.
class GlibProcessRunner final : public ProcessRunner {
public:
  ProcessResult run(const std::vector<std::string>& argv) override;
};

// First marker found in `text`, or empty.
std::string find_error_marker(const std::string& text, const std::vector<std::string>& markers);

// Lines of `text` containing any marker.
std::vector<std::string> error_lines(const std::string& text, const std::vector<std::string>& markers);

// Last `max_bytes` of text, cut at a line start when possible.
std::string tail(const std::string& text, std::size_t max_bytes);

// argv rendered for a POSIX shell (single quotes where needed).
std::string shell_join(const std::vector<std::string>& argv);

} // namespace ffweave
