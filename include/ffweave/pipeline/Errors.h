#pragma once

#include "ffweave/pipeline/RunReport.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace ffweave {

// Root of all graph construction / render failures.
class GraphError : public std::runtime_error {
public:
  explicit GraphError(const std::string& msg) : std::runtime_error(msg) {}
};

// Stream reused, slot taken, kind mismatch, no slot left.
class ConnectionError : public GraphError {
public:
  explicit ConnectionError(const std::string& msg) : GraphError(msg) {}
};

class NoFreeSlotError : public ConnectionError {
public:
  explicit NoFreeSlotError(const std::string& msg) : ConnectionError(msg) {}
};

class CyclicGraphError : public GraphError {
public:
  explicit CyclicGraphError(const std::string& msg) : GraphError(msg) {}
};

class DanglingOutputError : public GraphError {
public:
  explicit DanglingOutputError(const std::string& msg) : GraphError(msg) {}
};

class UnresolvedReferenceError : public GraphError {
public:
  explicit UnresolvedReferenceError(const std::string& msg) : GraphError(msg) {}
};

// Filter expecting homogeneous inputs got mixed kinds.
class IncompatibleStreamsError : public GraphError {
public:
  explicit IncompatibleStreamsError(const std::string& msg) : GraphError(msg) {}
};

class VectorLengthMismatchError : public GraphError {
public:
  explicit VectorLengthMismatchError(const std::string& msg) : GraphError(msg) {}
};

// Strict buffering analysis requested on streams without metadata.
class MetadataRequiredError : public GraphError {
public:
  explicit MetadataRequiredError(const std::string& msg) : GraphError(msg) {}
};

// Exception that carries a structured report of a failed ffmpeg run.
class FFmpegError : public std::runtime_error {
public:
  explicit FFmpegError(std::string msg);
  FFmpegError(std::string msg, RunReport report);
  const RunReport& report() const { return report_; }

private:
  RunReport report_;
};

} // namespace ffweave
