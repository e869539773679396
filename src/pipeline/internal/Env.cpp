#include "ffweave/pipeline/internal/Env.h"

#include <cstdlib>
#include <cstring>

namespace ffweave::pipeline_internal {

bool env_bool(const char* key, bool def_val) {
  const char* v = std::getenv(key);
  if (!v || !*v) return def_val;
  if (!std::strcmp(v, "1") || !std::strcmp(v, "true") || !std::strcmp(v, "TRUE") ||
      !std::strcmp(v, "yes") || !std::strcmp(v, "YES") ||
      !std::strcmp(v, "on")  || !std::strcmp(v, "ON")) {
    return true;
  }
  if (!std::strcmp(v, "0") || !std::strcmp(v, "false") || !std::strcmp(v, "FALSE") ||
      !std::strcmp(v, "no") || !std::strcmp(v, "NO") ||
      !std::strcmp(v, "off") || !std::strcmp(v, "OFF")) {
    return false;
  }
  return def_val;
}

int env_int(const char* key, int def_val) {
  const char* v = std::getenv(key);
  if (!v || !*v) return def_val;
  return std::atoi(v);
}

std::string env_str(const char* key, const std::string& def_val) {
  const char* v = std::getenv(key);
  if (!v || !*v) return def_val;
  return std::string(v);
}

} // namespace ffweave::pipeline_internal
