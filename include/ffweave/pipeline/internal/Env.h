#pragma once

#include <string>

namespace ffweave::pipeline_internal {

// Accepts 1/true/yes/on and 0/false/no/off; anything else yields def_val.
bool env_bool(const char* key, bool def_val);
int env_int(const char* key, int def_val);
std::string env_str(const char* key, const std::string& def_val);

} // namespace ffweave::pipeline_internal
