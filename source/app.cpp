#include <gitcmd/app.hpp>
#include <gitcmd/cli.hpp>
#include <gitcmd/error.hpp>
#include <gitcmd/repository.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <type_traits>

#ifndef GITCMD_VERSION
#define GITCMD_VERSION "unknown"
#endif
#ifndef GITCMD_COMMIT
#define GITCMD_COMMIT "unknown"
#endif

namespace fs = std::filesystem;

namespace gitcmd {

static void print_help() {
  std::cout <<
      R"(gitcmd - run git subcommands through the gitcmd library

Usage:
  gitcmd [-C <path>] [-v] <command> [args]

  init   [--bare] [--initial-branch <b>]
  clone  <url> [<dir>] [--branch <b>] [--origin <o>] [--depth <n>] [--bare]
  add    [<pathspec>...]
  commit -m <msg> [--all] [--allow-empty] [--amend] [<file>...]
  fetch  [<remote> [<refspec>...]] [--all] [--prune] [--tags]
  pull   [<remote> [<refspec>...]] [--rebase|--no-rebase] [--ff-only]
  push   [<remote> [<refspec>...]] [--set-upstream] [--force] [--tags] [--all]
  remote add <name> <url> | remove <name> | rename <old> <new> | set-url <name> <url>
  status [--json] [--ignored] [--untracked-files=all|no]
  stash  [push [-m <msg>] [-u] [-k] | pop [<n>] | apply [<n>] | drop [<n>] | clear]
  tag    <name> [<object>] [-m <msg>] [-f] | tag -d <name>...
  notes  [add|append] -m <msg> [<object>] | notes remove [<object>]

Environment:
  GITCMD_GIT              git binary (default: git from PATH)
  GITCMD_TERMINAL_PROMPT  1 to let git prompt for credentials
  GITCMD_LOG_LEVEL        trace|debug|info|warn|error|off
)";
}

static std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
    case '"':
      o += "\\\"";
      break;
    case '\\':
      o += "\\\\";
      break;
    case '\n':
      o += "\\n";
      break;
    case '\t':
      o += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        o += fmt::format("\\u{:04x}", static_cast<int>(c));
      else
        o += c;
    }
  }
  return o;
}

static std::string json_paths(const std::vector<StatusEntry> &v) {
  std::string o = "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i)
      o += ',';
    o += fmt::format(R"({{"xy":"{}{}","path":"{}"}})", v[i].index_status,
                     v[i].worktree_status, json_escape(v[i].path));
  }
  return o + "]";
}

static std::string json_paths(const std::vector<std::string> &v) {
  std::string o = "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i)
      o += ',';
    o += '"' + json_escape(v[i]) + '"';
  }
  return o + "]";
}

static void print_status(const Status &st, bool json) {
  if (json) {
    std::cout << fmt::format(
                     R"({{"head":"{}","oid":"{}","upstream":{},"ahead":{},"behind":{},"clean":{},"changed":{},"renamed":{},"unmerged":{},"untracked":{},"ignored":{}}})",
                     json_escape(st.branch_head), json_escape(st.branch_oid),
                     st.upstream ? '"' + json_escape(st.upstream->name) + '"'
                                 : std::string("null"),
                     st.upstream ? st.upstream->ahead : 0,
                     st.upstream ? st.upstream->behind : 0,
                     st.is_clean() ? "true" : "false", json_paths(st.changed),
                     json_paths(st.renamed), json_paths(st.unmerged),
                     json_paths(st.untracked), json_paths(st.ignored))
              << "\n";
    return;
  }

  std::cout << "## " << st.branch_head;
  if (st.upstream)
    std::cout << fmt::format("...{} [ahead {}, behind {}]",
                             st.upstream->name, st.upstream->ahead,
                             st.upstream->behind);
  std::cout << "\n";
  for (const auto &e : st.changed)
    std::cout << e.index_status << e.worktree_status << ' ' << e.path << "\n";
  for (const auto &e : st.renamed)
    std::cout << e.index_status << e.worktree_status << ' ' << e.orig_path
              << " -> " << e.path << "\n";
  for (const auto &e : st.unmerged)
    std::cout << e.index_status << e.worktree_status << ' ' << e.path << "\n";
  for (const auto &p : st.untracked)
    std::cout << "?? " << p << "\n";
  for (const auto &p : st.ignored)
    std::cout << "!! " << p << "\n";
}

static void setup_logging(bool verbose) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::warn);
  if (const char *lvl = ::getenv("GITCMD_LOG_LEVEL"))
    spdlog::set_level(spdlog::level::from_str(lvl));
  if (verbose)
    spdlog::set_level(spdlog::level::debug);
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  setup_logging(pr.verbose);

  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  const fs::path dir = pr.dir;

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("gitcmd {} ({})\n", GITCMD_VERSION,
                                     GITCMD_COMMIT);
            return 0;

          } else if constexpr (std::is_same_v<T, InitOptions>) {
            auto repo = Repository::init_at(dir, c);
            spdlog::info("[init] {}", repo.path().string());
            return 0;

          } else if constexpr (std::is_same_v<T, CloneOptions>) {
            auto repo = c.run(dir);
            spdlog::info("[clone] {} -> {}", c.url, repo.path().string());
            return 0;

          } else if constexpr (std::is_same_v<T, CmdStatus>) {
            auto repo = Repository::at(dir);
            print_status(c.opts.run(repo), c.json);
            return 0;

          } else {
            auto repo = Repository::at(dir);
            c.run(repo);
            return 0;
          }
        },
        *pr.cmd);

  } catch (const ExecutionError &e) {
    spdlog::debug("{}", e.what());
    std::cerr << e.stderr_text();
    return e.exit_code() != 0 ? e.exit_code() : 1;
  } catch (const NotARepository &e) {
    std::cerr << e.stderr_text();
    return e.exit_code() != 0 ? e.exit_code() : 128;
  } catch (const ConstructionError &e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const Error &e) {
    spdlog::error("[{}] {}", to_string(e.kind()), e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}

} // namespace gitcmd
