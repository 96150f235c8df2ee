#include <gitcmd/error.hpp>
#include <gitcmd/translate.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <vector>

namespace gitcmd {

void check_exit(const std::string &command, const std::filesystem::path &cwd,
                const ProcessOutput &out) {
  if (out.exit_code == 0)
    return;
  spdlog::debug("[git] {} failed rc={}: {}", command, out.exit_code, out.err);
  if (out.err.find("not a git repository") != std::string::npos)
    throw NotARepository(cwd, out.err, out.exit_code);
  throw ExecutionError(command, out.exit_code, out.err, out.out);
}

namespace {

constexpr const char *kStatus = "status";

[[noreturn]] void bad(std::string_view rec, const char *why) {
  throw ParseError(kStatus, std::string(rec), why);
}

// Splits `n` space separated fields off the front of `rec`; whatever
// follows the n-th space is returned as the tail (paths may hold spaces).
std::vector<std::string_view> fields(std::string_view rec, size_t n,
                                     std::string_view &tail) {
  std::vector<std::string_view> f;
  f.reserve(n);
  std::string_view rest = rec;
  for (size_t i = 0; i < n; ++i) {
    auto sp = rest.find(' ');
    if (sp == std::string_view::npos || sp == 0)
      bad(rec, "too few fields");
    f.push_back(rest.substr(0, sp));
    rest.remove_prefix(sp + 1);
  }
  if (rest.empty())
    bad(rec, "missing path");
  tail = rest;
  return f;
}

int to_int(std::string_view rec, std::string_view s) {
  int v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size() || v < 0)
    bad(rec, "bad number");
  return v;
}

bool status_letter(char c) {
  switch (c) {
  case '.':
  case 'M':
  case 'T':
  case 'A':
  case 'D':
  case 'R':
  case 'C':
  case 'U':
    return true;
  default:
    return false;
  }
}

void set_xy(StatusEntry &e, std::string_view rec, std::string_view xy) {
  if (xy.size() != 2 || !status_letter(xy[0]) || !status_letter(xy[1]))
    bad(rec, "bad XY field");
  e.index_status = xy[0];
  e.worktree_status = xy[1];
}

void set_sub(StatusEntry &e, std::string_view rec, std::string_view sub) {
  if (sub.size() != 4 || (sub[0] != 'N' && sub[0] != 'S'))
    bad(rec, "bad submodule field");
  e.submodule = std::string(sub);
}

// Returns true for the branch.oid and branch.head headers.
bool parse_header(Status &st, std::string_view rec) {
  // "# <key> <value...>"
  std::string_view body = rec.substr(1);
  if (body.empty() || body[0] != ' ')
    bad(rec, "bad header");
  body.remove_prefix(1);
  auto sp = body.find(' ');
  if (sp == std::string_view::npos)
    bad(rec, "bad header");
  std::string_view key = body.substr(0, sp);
  std::string_view val = body.substr(sp + 1);

  if (key == "branch.oid") {
    st.branch_oid = std::string(val);
    return true;
  } else if (key == "branch.head") {
    st.branch_head = std::string(val);
    return true;
  } else if (key == "branch.upstream") {
    if (!st.upstream)
      st.upstream = Upstream{};
    st.upstream->name = std::string(val);
  } else if (key == "branch.ab") {
    auto sp2 = val.find(' ');
    if (sp2 == std::string_view::npos || sp2 + 2 >= val.size() ||
        val[0] != '+' || val[sp2 + 1] != '-')
      bad(rec, "bad branch.ab");
    if (!st.upstream)
      st.upstream = Upstream{};
    st.upstream->ahead = to_int(rec, val.substr(1, sp2 - 1));
    st.upstream->behind = to_int(rec, val.substr(sp2 + 2));
  }
  // other headers (e.g. "# stash <n>") carry nothing we model
  return false;
}

} // namespace

Status parse_status(std::string_view out) {
  const std::string_view all = out;
  std::vector<std::string_view> recs;
  while (!out.empty()) {
    auto nul = out.find('\0');
    std::string_view rec = out.substr(0, nul);
    recs.push_back(rec);
    if (nul == std::string_view::npos)
      break;
    out.remove_prefix(nul + 1);
  }

  Status st{};
  bool branch = false;
  for (size_t i = 0; i < recs.size(); ++i) {
    std::string_view rec = recs[i];
    if (rec.empty())
      continue;
    if (rec.size() < 2 || rec[1] != ' ')
      bad(rec, "unknown record");

    std::string_view path;
    switch (rec[0]) {
    case '#':
      branch |= parse_header(st, rec);
      break;

    case '1': {
      // 1 XY sub mH mI mW hH hI path
      auto f = fields(rec, 8, path);
      StatusEntry e{};
      e.kind = EntryKind::Changed;
      set_xy(e, rec, f[1]);
      set_sub(e, rec, f[2]);
      e.mode_head = std::string(f[3]);
      e.mode_index = std::string(f[4]);
      e.mode_worktree = std::string(f[5]);
      e.object_head = std::string(f[6]);
      e.object_index = std::string(f[7]);
      e.path = std::string(path);
      st.changed.push_back(std::move(e));
      break;
    }

    case '2': {
      // 2 XY sub mH mI mW hH hI Xscore path \0 origPath
      auto f = fields(rec, 9, path);
      StatusEntry e{};
      set_xy(e, rec, f[1]);
      set_sub(e, rec, f[2]);
      e.mode_head = std::string(f[3]);
      e.mode_index = std::string(f[4]);
      e.mode_worktree = std::string(f[5]);
      e.object_head = std::string(f[6]);
      e.object_index = std::string(f[7]);
      std::string_view xs = f[8];
      if (xs.size() < 2 || (xs[0] != 'R' && xs[0] != 'C'))
        bad(rec, "bad score field");
      e.kind = xs[0] == 'R' ? EntryKind::Renamed : EntryKind::Copied;
      e.score = to_int(rec, xs.substr(1));
      e.path = std::string(path);
      if (i + 1 >= recs.size() || recs[i + 1].empty())
        bad(rec, "missing original path");
      e.orig_path = std::string(recs[++i]);
      st.renamed.push_back(std::move(e));
      break;
    }

    case 'u': {
      // u XY sub m1 m2 m3 mW h1 h2 h3 path
      auto f = fields(rec, 10, path);
      StatusEntry e{};
      e.kind = EntryKind::Unmerged;
      set_xy(e, rec, f[1]);
      set_sub(e, rec, f[2]);
      e.stage_modes = {std::string(f[3]), std::string(f[4]),
                       std::string(f[5])};
      e.mode_worktree = std::string(f[6]);
      e.stage_objects = {std::string(f[7]), std::string(f[8]),
                         std::string(f[9])};
      e.path = std::string(path);
      st.unmerged.push_back(std::move(e));
      break;
    }

    case '?':
    case '!':
      if (rec.size() < 3)
        bad(rec, "missing path");
      (rec[0] == '?' ? st.untracked : st.ignored).emplace_back(rec.substr(2));
      break;

    default:
      bad(rec, "unknown record");
    }
  }
  // --branch is always passed, so git always prints these
  if (!branch)
    bad(all.substr(0, 64), "missing branch headers");
  return st;
}

} // namespace gitcmd
