#include <gitcmd/error.hpp>

#include <fmt/format.h>

#include <cstring>
#include <utility>

namespace gitcmd {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::Environment:
    return "environment";
  case ErrorKind::Precondition:
    return "precondition";
  case ErrorKind::Construction:
    return "construction";
  case ErrorKind::Execution:
    return "execution";
  case ErrorKind::Parse:
    return "parse";
  }
  return "unknown";
}

EnvironmentError::EnvironmentError(std::string binary, int err,
                                   const std::string &what)
    : Error(ErrorKind::Environment, what), binary_(std::move(binary)),
      errno_(err) {}

BinaryNotFound::BinaryNotFound(std::string binary, int err)
    : EnvironmentError(binary, err,
                       fmt::format("{}: cannot execute: {}", binary,
                                   std::strerror(err))) {}

PathNotFound::PathNotFound(std::filesystem::path path)
    : PreconditionError(path, fmt::format("no such directory: {}",
                                          path.string())) {}

NotARepository::NotARepository(std::filesystem::path path,
                               std::string stderr_text, int exit_code)
    : PreconditionError(path, fmt::format("not a git repository: {}",
                                          path.string())),
      stderr_(std::move(stderr_text)), exit_code_(exit_code) {}

ConstructionError::ConstructionError(std::string command, std::string field,
                                     const std::string &reason)
    : Error(ErrorKind::Construction,
            fmt::format("git {}: {}: {}", command, field, reason)),
      command_(std::move(command)), field_(std::move(field)) {}

ExecutionError::ExecutionError(std::string command, int exit_code,
                               std::string stderr_text,
                               std::string stdout_text)
    : Error(ErrorKind::Execution,
            fmt::format("git {} returned error code {}", command, exit_code)),
      command_(std::move(command)), exit_code_(exit_code),
      stderr_(std::move(stderr_text)), stdout_(std::move(stdout_text)) {}

bool ExecutionError::locked() const {
  if (stderr_.find("index.lock") != std::string::npos)
    return true;
  return stderr_.find("Unable to create") != std::string::npos &&
         stderr_.find(".lock") != std::string::npos;
}

ParseError::ParseError(std::string command, std::string record,
                       const std::string &reason)
    : Error(ErrorKind::Parse, fmt::format("git {}: {}: '{}'", command, reason,
                                          record)),
      command_(std::move(command)), record_(std::move(record)) {}

} // namespace gitcmd
