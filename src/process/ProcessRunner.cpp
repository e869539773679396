#include "ffweave/process/ProcessRunner.h"

#include "ffweave/pipeline/internal/Env.h"

#include <glib.h>
#include <sys/wait.h>

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ffweave {

ProcessResult GlibProcessRunner::run(const std::vector<std::string>& argv) {
  if (argv.empty()) throw std::invalid_argument("GlibProcessRunner: empty argv");

  std::vector<gchar*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<gchar*>(a.c_str()));
  cargv.push_back(nullptr);

  const bool log = pipeline_internal::env_bool("FFWEAVE_DEBUG_RUN_LOG", false);
  if (log) std::cerr << "[ProcessRunner] spawn: " << shell_join(argv) << "\n";

  gchar* out = nullptr;
  gchar* err = nullptr;
  gint wait_status = 0;
  GError* error = nullptr;
  const gboolean ok = g_spawn_sync(nullptr, cargv.data(), nullptr, G_SPAWN_SEARCH_PATH, nullptr,
                                   nullptr, &out, &err, &wait_status, &error);
  if (!ok) {
    std::string msg = error ? error->message : "unknown error";
    if (error) g_error_free(error);
    g_free(out);
    g_free(err);
    throw std::runtime_error("GlibProcessRunner: failed to start " + argv.front() + ": " + msg);
  }

  ProcessResult r;
  r.out = out ? out : "";
  r.err = err ? err : "";
  g_free(out);
  g_free(err);
  r.exit_code = WIFEXITED(wait_status) ? WEXITSTATUS(wait_status) : -1;

  if (log) std::cerr << "[ProcessRunner] exit_code=" << r.exit_code << "\n";
  return r;
}

std::string find_error_marker(const std::string& text, const std::vector<std::string>& markers) {
  std::size_t best = std::string::npos;
  std::string found;
  for (const auto& m : markers) {
    if (m.empty()) continue;
    const std::size_t pos = text.find(m);
    if (pos != std::string::npos && pos < best) {
      best = pos;
      found = m;
    }
  }
  return found;
}

std::vector<std::string> error_lines(const std::string& text, const std::vector<std::string>& markers) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!find_error_marker(line, markers).empty()) lines.push_back(line);
  }
  return lines;
}

std::string tail(const std::string& text, std::size_t max_bytes) {
  if (text.size() <= max_bytes) return text;
  std::size_t from = text.size() - max_bytes;
  const std::size_t nl = text.find('\n', from);
  if (nl != std::string::npos && nl + 1 < text.size()) from = nl + 1;
  return text.substr(from);
}

std::string shell_join(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& a : argv) {
    if (!out.empty()) out += ' ';
    const bool plain = !a.empty() && a.find_first_not_of(
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_./:=,@+%") ==
        std::string::npos;
    if (plain) {
      out += a;
      continue;
    }
    out += '\'';
    for (char c : a) {
      if (c == '\'') {
        out += "'\\''";
      } else {
        out += c;
      }
    }
    out += '\'';
  }
  return out;
}

} // namespace ffweave
