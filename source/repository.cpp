#include <gitcmd/error.hpp>
#include <gitcmd/repository.hpp>
#include <gitcmd/translate.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace gitcmd {

Repository Repository::at(const fs::path &path,
                          std::shared_ptr<ProcessRunner> runner) {
  std::error_code ec;
  if (path.empty() || !fs::is_directory(path, ec))
    throw PathNotFound(path);
  fs::path abs = fs::canonical(path, ec);
  if (ec)
    throw PathNotFound(path);
  if (!runner)
    runner = default_runner();
  return Repository(std::move(abs), std::move(runner));
}

Repository Repository::init_at(const fs::path &path, const InitOptions &opts,
                               std::shared_ptr<ProcessRunner> runner) {
  std::error_code ec;
  if (!path.empty() && !fs::exists(path, ec)) {
    fs::create_directories(path, ec);
    if (ec)
      throw PreconditionError(path, fmt::format("cannot create {}: {}",
                                                path.string(), ec.message()));
    spdlog::debug("[git] created {}", path.string());
  }
  Repository repo = at(path, std::move(runner));
  opts.run(repo);
  return repo;
}

Repository Repository::clone(const std::string &url,
                             const fs::path &destination,
                             std::shared_ptr<ProcessRunner> runner) {
  CloneOptions o{};
  o.url = url;
  if (!destination.empty())
    o.directory = destination.string();
  return o.run(fs::current_path(), std::move(runner));
}

bool Repository::is_init() const {
  std::error_code ec;
  return fs::exists(path_ / ".git", ec);
}

ProcessOutput Repository::exec(const std::vector<std::string> &args) const {
  if (args.empty())
    throw ConstructionError("", "args", "subcommand required");
  std::error_code ec;
  if (!fs::is_directory(path_, ec))
    throw PathNotFound(path_);

  auto out = runner_->run(path_, args);
  check_exit(args.front(), path_, out);
  return out;
}

Repository &Repository::init() {
  InitOptions{}.run(*this);
  return *this;
}

Repository &Repository::add() {
  AddOptions o{};
  o.all = true;
  o.run(*this);
  return *this;
}

Repository &Repository::add(const std::vector<std::string> &pathspecs) {
  AddOptions o{};
  o.pathspecs = pathspecs;
  o.run(*this);
  return *this;
}

Repository &Repository::commit(const std::string &message) {
  CommitOptions o{};
  o.message = message;
  o.allow_empty = true;
  o.run(*this);
  return *this;
}

Repository &Repository::fetch() {
  FetchOptions o{};
  o.all = true;
  o.run(*this);
  return *this;
}

Repository &Repository::notes(const std::string &message) {
  NotesOptions o{};
  o.message = message;
  o.run(*this);
  return *this;
}

Repository &Repository::pull() {
  PullOptions{}.run(*this);
  return *this;
}

Repository &Repository::push() {
  PushOptions{}.run(*this);
  return *this;
}

Repository &Repository::remote(const std::string &name,
                               const std::string &url) {
  RemoteOptions o{RemoteAdd{name, url, std::nullopt, std::nullopt, false}};
  o.run(*this);
  return *this;
}

Repository &Repository::stash() {
  StashOptions{StashPush{}}.run(*this);
  return *this;
}

Repository &Repository::tag(const std::string &name) {
  TagOptions o{TagCreate{name, std::nullopt, std::nullopt, false}};
  o.run(*this);
  return *this;
}

Status Repository::status() const {
  StatusOptions o{};
  o.ignored = true;
  return o.run(*this);
}

} // namespace gitcmd
