#pragma once
#include <gitcmd/commands.hpp>
#include <gitcmd/process.hpp>
#include <gitcmd/status.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gitcmd {

// A directory bound as the working directory of every git call.
// Holds no state besides the path: all repository state is read from disk
// by git on each call. Methods throw on the first failure (see error.hpp).
class Repository {
public:
  // Throws PathNotFound unless `path` is an existing directory.
  static Repository at(const std::filesystem::path &path,
                       std::shared_ptr<ProcessRunner> runner = nullptr);

  // Creates `path` if needed, then runs `git init` there.
  static Repository init_at(const std::filesystem::path &path,
                            const InitOptions &opts = {},
                            std::shared_ptr<ProcessRunner> runner = nullptr);

  // Clones `url` into `destination` (relative to the current directory).
  static Repository clone(const std::string &url,
                          const std::filesystem::path &destination,
                          std::shared_ptr<ProcessRunner> runner = nullptr);

  const std::filesystem::path &path() const { return path_; }
  bool is_init() const;

  Repository &init();
  Repository &add();
  Repository &add(const std::vector<std::string> &pathspecs);
  Repository &commit(const std::string &message);
  Repository &fetch();
  Repository &notes(const std::string &message);
  Repository &pull();
  Repository &push();
  Repository &remote(const std::string &name, const std::string &url);
  Repository &stash();
  Repository &tag(const std::string &name);
  // status --ignored; ignored entries do not make the tree dirty
  Status status() const;

  // Runs `git args...` in path(); args[0] is the subcommand.
  // Throws PathNotFound (without spawning) if path() is gone, and whatever
  // check_exit() throws on a non-zero exit.
  ProcessOutput exec(const std::vector<std::string> &args) const;

  ProcessRunner &runner() const { return *runner_; }
  std::shared_ptr<ProcessRunner> shared_runner() const { return runner_; }

private:
  Repository(std::filesystem::path path, std::shared_ptr<ProcessRunner> runner)
      : path_(std::move(path)), runner_(std::move(runner)) {}

  std::filesystem::path path_;
  std::shared_ptr<ProcessRunner> runner_;
};

} // namespace gitcmd
