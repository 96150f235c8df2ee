#include <gitcmd/commands.hpp>
#include <gitcmd/error.hpp>
#include <gitcmd/repository.hpp>
#include <gitcmd/translate.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string_view>
#include <type_traits>

namespace fs = std::filesystem;

namespace gitcmd {

namespace {

void require(const char *cmd, const char *field, const std::string &v) {
  if (v.empty())
    throw ConstructionError(cmd, field, "required");
}

void require(const char *cmd, const char *field,
             const std::optional<std::string> &v) {
  if (v && v->empty())
    throw ConstructionError(cmd, field, "set but empty");
}

void require_each(const char *cmd, const char *field,
                  const std::vector<std::string> &v) {
  for (const auto &s : v) {
    if (s.empty())
      throw ConstructionError(cmd, field, "contains an empty entry");
  }
}

void append(std::vector<std::string> &dst, const std::vector<std::string> &src) {
  dst.insert(dst.end(), src.begin(), src.end());
}

std::string stash_ref(const std::optional<int> &index) {
  if (*index < 0)
    throw ConstructionError("stash", "index", "must not be negative");
  return fmt::format("stash@{{{}}}", *index);
}

} // namespace

std::vector<std::string> AddOptions::args() const {
  require_each("add", "pathspecs", pathspecs);

  std::vector<std::string> a{"add"};
  if (all)
    a.push_back(*all ? "--all" : "--no-all");
  if (chmod)
    a.push_back(*chmod ? "--chmod=+x" : "--chmod=-x");
  if (!pathspecs.empty()) {
    a.push_back("--");
    append(a, pathspecs);
  }
  return a;
}

void AddOptions::run(const Repository &repo) const { repo.exec(args()); }

std::string clone_dir_from_url(const std::string &url) {
  std::string s = url;
  auto strip_slashes = [&s] {
    while (!s.empty() && (s.back() == '/' || s.back() == ' '))
      s.pop_back();
  };
  auto strip_suffix = [&s](const char *suf) {
    std::string_view v(suf);
    if (s.size() > v.size() &&
        s.compare(s.size() - v.size(), v.size(), v) == 0)
      s.resize(s.size() - v.size());
  };

  strip_slashes();
  strip_suffix("/.git");
  strip_slashes();
  strip_suffix(".git");

  auto pos = s.find_last_of("/:");
  if (pos != std::string::npos)
    s = s.substr(pos + 1);
  if (s == "." || s == "..")
    return {};
  return s;
}

std::vector<std::string> CloneOptions::args() const {
  require("clone", "url", url);
  require("clone", "directory", directory);
  require("clone", "branch", branch);
  require("clone", "origin", origin);
  if (depth && *depth <= 0)
    throw ConstructionError("clone", "depth", "must be positive");

  std::vector<std::string> a{"clone"};
  if (bare)
    a.push_back("--bare");
  if (branch) {
    a.push_back("--branch");
    a.push_back(*branch);
  }
  if (origin) {
    a.push_back("--origin");
    a.push_back(*origin);
  }
  if (depth) {
    a.push_back("--depth");
    a.push_back(std::to_string(*depth));
  }
  a.push_back("--");
  a.push_back(url);
  if (directory)
    a.push_back(*directory);
  return a;
}

Repository CloneOptions::run(const fs::path &cwd,
                             std::shared_ptr<ProcessRunner> runner) const {
  require("clone", "url", url);
  CloneOptions o = *this;
  if (!o.directory) {
    std::string d = clone_dir_from_url(url);
    if (d.empty())
      throw ConstructionError("clone", "directory",
                              "cannot derive a directory from the url");
    o.directory = bare ? d + ".git" : d;
  }
  auto a = o.args();

  std::error_code ec;
  if (!fs::is_directory(cwd, ec))
    throw PathNotFound(cwd);
  if (!runner)
    runner = default_runner();

  spdlog::debug("[git] clone {} -> {}", url, *o.directory);
  auto out = runner->run(cwd, a);
  check_exit("clone", cwd, out);

  fs::path dest(*o.directory);
  return Repository::at(dest.is_absolute() ? dest : cwd / dest,
                        std::move(runner));
}

std::vector<std::string> CommitOptions::args() const {
  require_each("commit", "files", files);

  std::vector<std::string> a{"commit", "-q"};
  if (!message.empty()) {
    a.push_back("-m");
    a.push_back(message);
  } else if (amend) {
    a.push_back("--no-edit");
  } else {
    throw ConstructionError("commit", "message", "required");
  }
  if (all)
    a.push_back("--all");
  if (allow_empty)
    a.push_back("--allow-empty");
  if (amend)
    a.push_back("--amend");
  if (!files.empty()) {
    a.push_back("--");
    append(a, files);
  }
  return a;
}

void CommitOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> FetchOptions::args() const {
  require("fetch", "remote", remote);
  require_each("fetch", "refspecs", refspecs);
  if (all && remote)
    throw ConstructionError("fetch", "remote", "conflicts with all");
  if (!refspecs.empty() && !remote)
    throw ConstructionError("fetch", "remote", "required with refspecs");

  std::vector<std::string> a{"fetch", "-q"};
  if (all)
    a.push_back("--all");
  if (prune)
    a.push_back("--prune");
  if (tags)
    a.push_back("--tags");
  if (remote)
    a.push_back(*remote);
  append(a, refspecs);
  return a;
}

void FetchOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> InitOptions::args() const {
  require("init", "initial_branch", initial_branch);

  std::vector<std::string> a{"init", "-q"};
  if (bare)
    a.push_back("--bare");
  if (initial_branch)
    a.push_back("--initial-branch=" + *initial_branch);
  return a;
}

void InitOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> NotesOptions::args() const {
  require("notes", "object", object);
  if (force && action != NotesAction::Add)
    throw ConstructionError("notes", "force", "only valid for add");

  std::vector<std::string> a{"notes"};
  switch (action) {
  case NotesAction::Add:
  case NotesAction::Append:
    require("notes", "message", message);
    a.push_back(action == NotesAction::Add ? "add" : "append");
    if (force)
      a.push_back("-f");
    a.push_back("-m");
    a.push_back(message);
    break;
  case NotesAction::Remove:
    if (!message.empty())
      throw ConstructionError("notes", "message", "not valid for remove");
    a.push_back("remove");
    break;
  }
  if (object)
    a.push_back(*object);
  return a;
}

void NotesOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> PullOptions::args() const {
  require("pull", "remote", remote);
  require_each("pull", "refspecs", refspecs);
  if (!refspecs.empty() && !remote)
    throw ConstructionError("pull", "remote", "required with refspecs");

  std::vector<std::string> a{"pull", "-q"};
  if (rebase)
    a.push_back(*rebase ? "--rebase" : "--no-rebase");
  if (ff_only)
    a.push_back("--ff-only");
  if (allow_unrelated)
    a.push_back("--allow-unrelated-histories");
  if (remote)
    a.push_back(*remote);
  append(a, refspecs);
  return a;
}

void PullOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> PushOptions::args() const {
  require("push", "remote", remote);
  require_each("push", "refspecs", refspecs);
  if (all && !refspecs.empty())
    throw ConstructionError("push", "refspecs", "conflicts with all");
  if (all && tags)
    throw ConstructionError("push", "tags", "conflicts with all");
  if (!refspecs.empty() && !remote)
    throw ConstructionError("push", "remote", "required with refspecs");

  std::vector<std::string> a{"push", "-q"};
  if (all)
    a.push_back("--all");
  if (tags)
    a.push_back("--tags");
  if (force)
    a.push_back("--force");
  if (set_upstream)
    a.push_back("--set-upstream");
  if (remote)
    a.push_back(*remote);
  append(a, refspecs);
  return a;
}

void PushOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> RemoteOptions::args() const {
  return std::visit(
      [](auto &&c) -> std::vector<std::string> {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, RemoteAdd>) {
          require("remote", "name", c.name);
          require("remote", "url", c.url);
          require("remote", "master", c.master);
          std::vector<std::string> a{"remote", "add"};
          if (c.fetch)
            a.push_back("-f");
          if (c.tags)
            a.push_back(*c.tags ? "--tags" : "--no-tags");
          if (c.master) {
            a.push_back("-m");
            a.push_back(*c.master);
          }
          a.push_back(c.name);
          a.push_back(c.url);
          return a;

        } else if constexpr (std::is_same_v<T, RemoteRemove>) {
          require("remote", "name", c.name);
          return {"remote", "remove", c.name};

        } else if constexpr (std::is_same_v<T, RemoteRename>) {
          require("remote", "old_name", c.old_name);
          require("remote", "new_name", c.new_name);
          return {"remote", "rename", c.old_name, c.new_name};

        } else {
          require("remote", "name", c.name);
          require("remote", "url", c.url);
          return {"remote", "set-url", c.name, c.url};
        }
      },
      action);
}

void RemoteOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> StatusOptions::args() const {
  std::vector<std::string> a{"status", "--porcelain=v2", "--branch", "-z"};
  switch (untracked) {
  case UntrackedMode::Normal:
    break;
  case UntrackedMode::All:
    a.push_back("--untracked-files=all");
    break;
  case UntrackedMode::No:
    a.push_back("--untracked-files=no");
    break;
  }
  if (ignored)
    a.push_back("--ignored");
  return a;
}

Status StatusOptions::run(const Repository &repo) const {
  auto out = repo.exec(args());
  return parse_status(out.out);
}

std::vector<std::string> StashOptions::args() const {
  return std::visit(
      [](auto &&c) -> std::vector<std::string> {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, StashPush>) {
          require("stash", "message", c.message);
          require_each("stash", "pathspecs", c.pathspecs);
          std::vector<std::string> a{"stash", "push", "-q"};
          if (c.include_untracked)
            a.push_back("--include-untracked");
          if (c.keep_index)
            a.push_back("--keep-index");
          if (c.message) {
            a.push_back("-m");
            a.push_back(*c.message);
          }
          if (!c.pathspecs.empty()) {
            a.push_back("--");
            append(a, c.pathspecs);
          }
          return a;

        } else if constexpr (std::is_same_v<T, StashClear>) {
          (void)c;
          return {"stash", "clear"};

        } else {
          const char *verb = std::is_same_v<T, StashPop>     ? "pop"
                             : std::is_same_v<T, StashApply> ? "apply"
                                                             : "drop";
          std::vector<std::string> a{"stash", verb, "-q"};
          if (c.index)
            a.push_back(stash_ref(c.index));
          return a;
        }
      },
      action);
}

void StashOptions::run(const Repository &repo) const { repo.exec(args()); }

std::vector<std::string> TagOptions::args() const {
  return std::visit(
      [](auto &&c) -> std::vector<std::string> {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, TagCreate>) {
          require("tag", "name", c.name);
          require("tag", "message", c.message);
          require("tag", "object", c.object);
          std::vector<std::string> a{"tag"};
          if (c.force)
            a.push_back("-f");
          if (c.message) {
            a.push_back("-a");
            a.push_back("-m");
            a.push_back(*c.message);
          }
          a.push_back(c.name);
          if (c.object)
            a.push_back(*c.object);
          return a;

        } else {
          if (c.names.empty())
            throw ConstructionError("tag", "names", "required");
          require_each("tag", "names", c.names);
          std::vector<std::string> a{"tag", "-d"};
          append(a, c.names);
          return a;
        }
      },
      action);
}

void TagOptions::run(const Repository &repo) const { repo.exec(args()); }

} // namespace gitcmd
