#pragma once
#include <gitcmd/status.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gitcmd {

class Repository;
class ProcessRunner;

// Every options struct renders itself with args(): the full argument list
// after the binary name, subcommand first. args() performs no I/O and throws
// ConstructionError when a required field is missing or fields conflict.
// run() renders, executes in the repository and translates the result.

struct AddOptions {
  std::optional<bool> all;   // --all / --no-all
  std::optional<bool> chmod; // --chmod=+x / --chmod=-x
  std::vector<std::string> pathspecs;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

struct CloneOptions {
  std::string url;
  std::optional<std::string> directory; // derived from url when unset
  std::optional<std::string> branch;
  std::optional<std::string> origin;
  std::optional<int> depth;
  bool bare = false;

  std::vector<std::string> args() const;

  // Clones relative to `cwd` and returns a handle on the new repository.
  Repository run(const std::filesystem::path &cwd,
                 std::shared_ptr<ProcessRunner> runner = nullptr) const;
};

struct CommitOptions {
  std::string message; // may stay empty only with amend (reuses the message)
  bool all = false;
  bool allow_empty = false;
  bool amend = false;
  std::vector<std::string> files;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

struct FetchOptions {
  bool all = false;
  bool prune = false;
  bool tags = false;
  std::optional<std::string> remote;
  std::vector<std::string> refspecs;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

struct InitOptions {
  bool bare = false;
  std::optional<std::string> initial_branch;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

enum class NotesAction { Add, Append, Remove };

struct NotesOptions {
  NotesAction action = NotesAction::Add;
  std::string message;
  std::optional<std::string> object; // HEAD when unset
  bool force = false;                // add only: overwrite an existing note

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

struct PullOptions {
  std::optional<std::string> remote;
  std::vector<std::string> refspecs;
  std::optional<bool> rebase; // --rebase / --no-rebase
  bool ff_only = false;
  bool allow_unrelated = false;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

struct PushOptions {
  std::optional<std::string> remote;
  std::vector<std::string> refspecs;
  bool all = false;
  bool tags = false;
  bool force = false;
  bool set_upstream = false;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

struct RemoteAdd {
  std::string name;
  std::string url;
  std::optional<std::string> master;
  std::optional<bool> tags; // --tags / --no-tags
  bool fetch = false;
};
struct RemoteRemove {
  std::string name;
};
struct RemoteRename {
  std::string old_name;
  std::string new_name;
};
struct RemoteSetUrl {
  std::string name;
  std::string url;
};

struct RemoteOptions {
  std::variant<RemoteAdd, RemoteRemove, RemoteRename, RemoteSetUrl> action;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

enum class UntrackedMode { Normal, All, No };

struct StatusOptions {
  UntrackedMode untracked = UntrackedMode::Normal;
  bool ignored = false;

  std::vector<std::string> args() const;
  Status run(const Repository &repo) const;
};

struct StashPush {
  std::optional<std::string> message;
  bool include_untracked = false;
  bool keep_index = false;
  std::vector<std::string> pathspecs;
};
struct StashPop {
  std::optional<int> index;
};
struct StashApply {
  std::optional<int> index;
};
struct StashDrop {
  std::optional<int> index;
};
struct StashClear {};

struct StashOptions {
  std::variant<StashPush, StashPop, StashApply, StashDrop, StashClear> action;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

struct TagCreate {
  std::string name;
  std::optional<std::string> message; // annotated tag when set
  std::optional<std::string> object;
  bool force = false;
};
struct TagDelete {
  std::vector<std::string> names;
};

struct TagOptions {
  std::variant<TagCreate, TagDelete> action;

  std::vector<std::string> args() const;
  void run(const Repository &repo) const;
};

// "https://host/group/name.git/" -> "name", as `git clone` picks it.
// Empty when nothing usable is left.
std::string clone_dir_from_url(const std::string &url);

} // namespace gitcmd
