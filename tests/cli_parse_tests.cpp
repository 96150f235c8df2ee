#include <catch2/catch.hpp>
#include <gitcmd/cli.hpp>

#include <string>
#include <vector>

using namespace gitcmd;
using Args = std::vector<std::string>;

static ParseResult parse(std::vector<std::string> words) {
  words.insert(words.begin(), "gitcmd");
  std::vector<char *> argv;
  for (auto &w : words)
    argv.push_back(w.data());
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

TEST_CASE("no arguments shows help") {
  auto r = parse({});
  REQUIRE(r.cmd.has_value());
  REQUIRE(std::holds_alternative<CmdHelp>(*r.cmd));
}

TEST_CASE("global options come before the command") {
  auto r = parse({"-C", "/srv/repo", "-v", "status", "--json"});
  REQUIRE(r.error.empty());
  REQUIRE(r.dir == "/srv/repo");
  REQUIRE(r.verbose);
  auto &c = std::get<CmdStatus>(*r.cmd);
  REQUIRE(c.json);
}

TEST_CASE("push with remote and refspec") {
  auto r = parse({"push", "origin", "main", "--set-upstream"});
  auto &o = std::get<PushOptions>(*r.cmd);
  REQUIRE(o.args() ==
          Args{"push", "-q", "--set-upstream", "origin", "main"});
}

TEST_CASE("commit and add") {
  auto c = parse({"commit", "-m", "msg", "--all"});
  REQUIRE(std::get<CommitOptions>(*c.cmd).args() ==
          Args{"commit", "-q", "-m", "msg", "--all"});

  auto a = parse({"add"});
  REQUIRE(std::get<AddOptions>(*a.cmd).args() == Args{"add", "--all"});

  auto p = parse({"add", "src", "docs"});
  REQUIRE(std::get<AddOptions>(*p.cmd).args() ==
          Args{"add", "--", "src", "docs"});
}

TEST_CASE("clone arguments and errors") {
  auto r = parse({"clone", "https://example.com/x.git", "dest", "--depth", "1"});
  auto &o = std::get<CloneOptions>(*r.cmd);
  REQUIRE(o.url == "https://example.com/x.git");
  REQUIRE(o.directory == std::optional<std::string>("dest"));
  REQUIRE(o.depth == std::optional<int>(1));

  REQUIRE_FALSE(parse({"clone"}).error.empty());
  REQUIRE_FALSE(parse({"clone", "u", "--depth", "x"}).error.empty());
}

TEST_CASE("remote, stash, tag and notes actions") {
  auto rm = parse({"remote", "rename", "a", "b"});
  REQUIRE(std::get<RemoteOptions>(*rm.cmd).args() ==
          Args{"remote", "rename", "a", "b"});
  REQUIRE_FALSE(parse({"remote", "add", "only-name"}).error.empty());

  auto st = parse({"stash", "pop", "1"});
  REQUIRE(std::get<StashOptions>(*st.cmd).args() ==
          Args{"stash", "pop", "-q", "stash@{1}"});
  auto push = parse({"stash", "-m", "wip"});
  REQUIRE(std::get<StashOptions>(*push.cmd).args() ==
          Args{"stash", "push", "-q", "-m", "wip"});

  auto del = parse({"tag", "-d", "v1", "v2"});
  REQUIRE(std::get<TagOptions>(*del.cmd).args() ==
          Args{"tag", "-d", "v1", "v2"});

  auto note = parse({"notes", "append", "-m", "more", "HEAD~1"});
  REQUIRE(std::get<NotesOptions>(*note.cmd).args() ==
          Args{"notes", "append", "-m", "more", "HEAD~1"});
}

TEST_CASE("flags that do not apply to the action are rejected") {
  REQUIRE(parse({"stash", "pop", "-m", "x"}).error ==
          "stash: unexpected argument: -m");
  REQUIRE_FALSE(parse({"stash", "drop", "-u"}).error.empty());
  REQUIRE_FALSE(parse({"stash", "clear", "-k"}).error.empty());
  REQUIRE_FALSE(parse({"tag", "-d", "v1", "-f"}).error.empty());
  REQUIRE_FALSE(parse({"tag", "-m", "msg", "-d", "v1"}).error.empty());

  auto keep = parse({"stash", "push", "-u", "-k", "-m", "wip"});
  REQUIRE(keep.error.empty());
  REQUIRE(std::holds_alternative<StashOptions>(*keep.cmd));
}

TEST_CASE("unknown command") {
  auto r = parse({"frobnicate"});
  REQUIRE_FALSE(r.cmd.has_value());
  REQUIRE(r.error == "unknown command: frobnicate");
}
