#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace gitcmd {

enum class ErrorKind { Environment, Precondition, Construction, Execution, Parse };

const char *to_string(ErrorKind k);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// git could not be spawned at all
class EnvironmentError : public Error {
public:
  EnvironmentError(std::string binary, int err, const std::string &what);

  const std::string &binary() const { return binary_; }
  int error_code() const { return errno_; }

private:
  std::string binary_;
  int errno_{0};
};

class BinaryNotFound : public EnvironmentError {
public:
  BinaryNotFound(std::string binary, int err);
};

class PreconditionError : public Error {
public:
  PreconditionError(std::filesystem::path path, const std::string &what)
      : Error(ErrorKind::Precondition, what), path_(std::move(path)) {}

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

class PathNotFound : public PreconditionError {
public:
  explicit PathNotFound(std::filesystem::path path);
};

class NotARepository : public PreconditionError {
public:
  NotARepository(std::filesystem::path path, std::string stderr_text,
                 int exit_code = 128);

  const std::string &stderr_text() const { return stderr_; }
  int exit_code() const { return exit_code_; }

private:
  std::string stderr_;
  int exit_code_{128};
};

class ConstructionError : public Error {
public:
  ConstructionError(std::string command, std::string field,
                    const std::string &reason);

  const std::string &command() const { return command_; }
  const std::string &field() const { return field_; }

private:
  std::string command_;
  std::string field_;
};

class ExecutionError : public Error {
public:
  ExecutionError(std::string command, int exit_code, std::string stderr_text,
                 std::string stdout_text = {});

  const std::string &command() const { return command_; }
  int exit_code() const { return exit_code_; }
  const std::string &stderr_text() const { return stderr_; }
  const std::string &stdout_text() const { return stdout_; }

  // another git process holds the repository lock
  bool locked() const;

private:
  std::string command_;
  int exit_code_{0};
  std::string stderr_;
  std::string stdout_;
};

class ParseError : public Error {
public:
  ParseError(std::string command, std::string record,
             const std::string &reason);

  const std::string &command() const { return command_; }
  const std::string &record() const { return record_; }

private:
  std::string command_;
  std::string record_;
};

} // namespace gitcmd
