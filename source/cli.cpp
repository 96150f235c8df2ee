#include <gitcmd/cli.hpp>

#include <cstdlib>
#include <string_view>
#include <vector>

namespace gitcmd {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool parse_int(const char *s, int &out) {
  char *end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (end == s || *end != '\0')
    return false;
  out = static_cast<int>(v);
  return true;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};

  int i = 1;
  while (i < argc) {
    std::string_view a = argv[i];
    if (a == "-C" && has_arg(i, argc)) {
      r.dir = argv[++i];
    } else if (a == "-v" || a == "--verbose") {
      r.verbose = true;
    } else {
      break;
    }
    ++i;
  }

  if (i >= argc) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = argv[i++];
  if (cmd == "--help" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  // options are matched by the per-command loops below; anything that is
  // not an option lands in `pos`
  std::vector<std::string> pos;
  auto fail = [&](const std::string &msg) {
    r.error = cmd + ": " + msg;
    return r;
  };

  if (cmd == "init") {
    InitOptions o{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--bare")
        o.bare = true;
      else if (a == "--initial-branch" && has_arg(i, argc))
        o.initial_branch = argv[++i];
      else
        return fail("unexpected argument: " + std::string(a));
    }
    r.cmd = o;
    return r;
  }

  if (cmd == "clone") {
    CloneOptions o{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--branch" && has_arg(i, argc))
        o.branch = argv[++i];
      else if (a == "--origin" && has_arg(i, argc))
        o.origin = argv[++i];
      else if (a == "--bare")
        o.bare = true;
      else if (a == "--depth" && has_arg(i, argc)) {
        int d = 0;
        if (!parse_int(argv[++i], d))
          return fail("--depth expects a number");
        o.depth = d;
      } else
        pos.emplace_back(a);
    }
    if (pos.empty() || pos.size() > 2)
      return fail("<url> [<dir>] required");
    o.url = pos[0];
    if (pos.size() == 2)
      o.directory = pos[1];
    r.cmd = o;
    return r;
  }

  if (cmd == "add") {
    AddOptions o{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--all" || a == "-A")
        o.all = true;
      else
        o.pathspecs.emplace_back(a);
    }
    if (o.pathspecs.empty() && !o.all)
      o.all = true;
    r.cmd = o;
    return r;
  }

  if (cmd == "commit") {
    CommitOptions o{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if ((a == "-m" || a == "--message") && has_arg(i, argc))
        o.message = argv[++i];
      else if (a == "--all" || a == "-a")
        o.all = true;
      else if (a == "--allow-empty")
        o.allow_empty = true;
      else if (a == "--amend")
        o.amend = true;
      else
        o.files.emplace_back(a);
    }
    r.cmd = o;
    return r;
  }

  if (cmd == "fetch") {
    FetchOptions o{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--all")
        o.all = true;
      else if (a == "--prune")
        o.prune = true;
      else if (a == "--tags")
        o.tags = true;
      else
        pos.emplace_back(a);
    }
    if (!pos.empty()) {
      o.remote = pos[0];
      o.refspecs.assign(pos.begin() + 1, pos.end());
    }
    r.cmd = o;
    return r;
  }

  if (cmd == "pull") {
    PullOptions o{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--rebase")
        o.rebase = true;
      else if (a == "--no-rebase")
        o.rebase = false;
      else if (a == "--ff-only")
        o.ff_only = true;
      else if (a == "--allow-unrelated-histories")
        o.allow_unrelated = true;
      else
        pos.emplace_back(a);
    }
    if (!pos.empty()) {
      o.remote = pos[0];
      o.refspecs.assign(pos.begin() + 1, pos.end());
    }
    r.cmd = o;
    return r;
  }

  if (cmd == "push") {
    PushOptions o{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--set-upstream" || a == "-u")
        o.set_upstream = true;
      else if (a == "--force" || a == "-f")
        o.force = true;
      else if (a == "--tags")
        o.tags = true;
      else if (a == "--all")
        o.all = true;
      else
        pos.emplace_back(a);
    }
    if (!pos.empty()) {
      o.remote = pos[0];
      o.refspecs.assign(pos.begin() + 1, pos.end());
    }
    r.cmd = o;
    return r;
  }

  if (cmd == "remote") {
    for (; i < argc; i++)
      pos.emplace_back(argv[i]);
    if (pos.empty())
      return fail("add|remove|rename|set-url required");
    const std::string &verb = pos[0];
    if (verb == "add" && pos.size() == 3)
      r.cmd = RemoteOptions{RemoteAdd{pos[1], pos[2], std::nullopt,
                                      std::nullopt, false}};
    else if ((verb == "remove" || verb == "rm") && pos.size() == 2)
      r.cmd = RemoteOptions{RemoteRemove{pos[1]}};
    else if (verb == "rename" && pos.size() == 3)
      r.cmd = RemoteOptions{RemoteRename{pos[1], pos[2]}};
    else if (verb == "set-url" && pos.size() == 3)
      r.cmd = RemoteOptions{RemoteSetUrl{pos[1], pos[2]}};
    else
      return fail("bad arguments for '" + verb + "'");
    return r;
  }

  if (cmd == "status") {
    CmdStatus c{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--json")
        c.json = true;
      else if (a == "--ignored")
        c.opts.ignored = true;
      else if (a == "--untracked-files=all" || a == "-uall")
        c.opts.untracked = UntrackedMode::All;
      else if (a == "--untracked-files=no" || a == "-uno")
        c.opts.untracked = UntrackedMode::No;
      else
        return fail("unexpected argument: " + std::string(a));
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "stash") {
    std::string verb = "push";
    if (i < argc && argv[i][0] != '-')
      verb = argv[i++];

    StashPush push{};
    std::optional<int> index;
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (verb != "push" && !a.empty() && a[0] == '-')
        return fail("unexpected argument: " + std::string(a));
      if ((a == "-m" || a == "--message") && has_arg(i, argc))
        push.message = argv[++i];
      else if (a == "-u" || a == "--include-untracked")
        push.include_untracked = true;
      else if (a == "-k" || a == "--keep-index")
        push.keep_index = true;
      else {
        int n = 0;
        if (verb != "push" && parse_int(argv[i], n))
          index = n;
        else if (verb == "push")
          push.pathspecs.emplace_back(a);
        else
          return fail("unexpected argument: " + std::string(a));
      }
    }

    if (verb == "push")
      r.cmd = StashOptions{push};
    else if (verb == "pop")
      r.cmd = StashOptions{StashPop{index}};
    else if (verb == "apply")
      r.cmd = StashOptions{StashApply{index}};
    else if (verb == "drop")
      r.cmd = StashOptions{StashDrop{index}};
    else if (verb == "clear")
      r.cmd = StashOptions{StashClear{}};
    else
      return fail("unknown action: " + verb);
    return r;
  }

  if (cmd == "tag") {
    bool del = false;
    TagCreate create{};
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "-d" || a == "--delete")
        del = true;
      else if (a == "-f" || a == "--force")
        create.force = true;
      else if ((a == "-m" || a == "--message") && has_arg(i, argc))
        create.message = argv[++i];
      else
        pos.emplace_back(a);
    }
    if (pos.empty())
      return fail("<name> required");
    if (del) {
      if (create.force || create.message)
        return fail("-m and -f cannot be used with -d");
      r.cmd = TagOptions{TagDelete{pos}};
    } else {
      if (pos.size() > 2)
        return fail("<name> [<object>] expected");
      create.name = pos[0];
      if (pos.size() == 2)
        create.object = pos[1];
      r.cmd = TagOptions{create};
    }
    return r;
  }

  if (cmd == "notes") {
    NotesOptions o{};
    std::string verb = "add";
    if (i < argc && argv[i][0] != '-')
      verb = argv[i++];
    if (verb == "add")
      o.action = NotesAction::Add;
    else if (verb == "append")
      o.action = NotesAction::Append;
    else if (verb == "remove")
      o.action = NotesAction::Remove;
    else
      return fail("unknown action: " + verb);

    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if ((a == "-m" || a == "--message") && has_arg(i, argc))
        o.message = argv[++i];
      else if (a == "-f" || a == "--force")
        o.force = true;
      else
        pos.emplace_back(a);
    }
    if (pos.size() > 1)
      return fail("at most one <object> expected");
    if (!pos.empty())
      o.object = pos[0];
    r.cmd = o;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace gitcmd
