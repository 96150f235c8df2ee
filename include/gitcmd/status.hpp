#pragma once
#include <optional>
#include <string>
#include <vector>

namespace gitcmd {

enum class EntryKind { Changed, Renamed, Copied, Unmerged, Untracked, Ignored };

// One record of `git status --porcelain=v2`.
// Status letters: '.' unmodified, M, T, A, D, R, C, U.
struct StatusEntry {
  EntryKind kind{EntryKind::Changed};

  char index_status{'.'};
  char worktree_status{'.'};

  // "N..." or "S<c><m><u>"
  std::string submodule;

  std::string mode_head;
  std::string mode_index;
  std::string mode_worktree;
  // unmerged entries only: modes/objects of stages 1-3
  std::vector<std::string> stage_modes;
  std::vector<std::string> stage_objects;

  std::string object_head;
  std::string object_index;

  std::string path;
  std::string orig_path; // renamed/copied only
  int score{0};          // renamed/copied only

  bool is_submodule() const { return !submodule.empty() && submodule[0] == 'S'; }
};

struct Upstream {
  std::string name;
  int ahead{0};
  int behind{0};
};

struct Status {
  std::string branch_oid;  // "(initial)" before the first commit
  std::string branch_head; // "(detached)" when HEAD is detached
  std::optional<Upstream> upstream;

  std::vector<StatusEntry> changed;
  std::vector<StatusEntry> renamed; // renamed and copied
  std::vector<StatusEntry> unmerged;
  std::vector<std::string> untracked;
  std::vector<std::string> ignored;

  bool is_clean() const {
    return changed.empty() && renamed.empty() && unmerged.empty() &&
           untracked.empty();
  }
};

} // namespace gitcmd
