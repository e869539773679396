// src/pipeline/Errors.cpp
#include "ffweave/pipeline/Errors.h"

#include <utility>

namespace ffweave {

FFmpegError::FFmpegError(std::string msg, RunReport report)
  : std::runtime_error(std::move(msg)),
    report_(std::move(report)) {}

FFmpegError::FFmpegError(std::string msg)
  : std::runtime_error(std::move(msg)), report_{} {}

} // namespace ffweave
