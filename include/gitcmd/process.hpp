#pragma once
#include <gitcmd/config.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gitcmd {

struct ProcessOutput {
  std::string out;
  std::string err;
  int exit_code{0};
};

// Runs `<binary> args...` in `cwd` and blocks until it exits.
// Implementations throw EnvironmentError / BinaryNotFound when the binary
// cannot be started and PathNotFound when `cwd` cannot be entered; a
// non-zero exit is not an error at this level.
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  virtual ProcessOutput run(const std::filesystem::path &cwd,
                            const std::vector<std::string> &args) = 0;
};

class GitProcessRunner : public ProcessRunner {
public:
  explicit GitProcessRunner(Config cfg = Config::from_env())
      : cfg_(std::move(cfg)) {}

  ProcessOutput run(const std::filesystem::path &cwd,
                    const std::vector<std::string> &args) override;

  const Config &config() const { return cfg_; }

private:
  Config cfg_;
};

std::shared_ptr<ProcessRunner> default_runner();

// For logs only; not a shell-safe quoting.
std::string format_command(const std::string &binary,
                           const std::vector<std::string> &args);

} // namespace gitcmd
