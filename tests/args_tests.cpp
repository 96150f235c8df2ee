#include <catch2/catch.hpp>
#include <gitcmd/commands.hpp>
#include <gitcmd/error.hpp>

#include <string>
#include <vector>

using namespace gitcmd;
using Args = std::vector<std::string>;

TEST_CASE("add arguments") {
  REQUIRE(AddOptions{}.args() == Args{"add"});

  AddOptions o{};
  o.all = false;
  o.chmod = false;
  o.pathspecs = {"foobar"};
  REQUIRE(o.args() == Args{"add", "--no-all", "--chmod=-x", "--", "foobar"});

  o.all = true;
  o.chmod = true;
  o.pathspecs = {"foo", "bar"};
  REQUIRE(o.args() ==
          Args{"add", "--all", "--chmod=+x", "--", "foo", "bar"});

  o.pathspecs = {"foo", ""};
  REQUIRE_THROWS_AS(o.args(), ConstructionError);
}

TEST_CASE("clone arguments") {
  CloneOptions o{};
  REQUIRE_THROWS_AS(o.args(), ConstructionError);

  o.url = "https://example.com/foobar.git";
  REQUIRE(o.args() == Args{"clone", "--", "https://example.com/foobar.git"});

  o.branch = "dev";
  o.origin = "upstream";
  o.depth = 1;
  o.directory = "work";
  REQUIRE(o.args() == Args{"clone", "--branch", "dev", "--origin", "upstream",
                           "--depth", "1", "--",
                           "https://example.com/foobar.git", "work"});

  SECTION("non-positive depth") {
    o.depth = 0;
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
  SECTION("empty branch") {
    o.branch = "";
    try {
      (void)o.args();
      FAIL("expected ConstructionError");
    } catch (const ConstructionError &e) {
      REQUIRE(e.command() == "clone");
      REQUIRE(e.field() == "branch");
      REQUIRE(e.kind() == ErrorKind::Construction);
    }
  }
}

TEST_CASE("clone directory derived from url") {
  REQUIRE(clone_dir_from_url("https://example.com/group/foobar.git") ==
          "foobar");
  REQUIRE(clone_dir_from_url("https://example.com/group/foobar/") == "foobar");
  REQUIRE(clone_dir_from_url("git@example.com:group/foobar.git") == "foobar");
  REQUIRE(clone_dir_from_url("/srv/repos/project/.git") == "project");
  REQUIRE(clone_dir_from_url("host:repo") == "repo");
  REQUIRE(clone_dir_from_url("..").empty());
  REQUIRE(clone_dir_from_url("").empty());
}

TEST_CASE("commit arguments") {
  CommitOptions o{};
  REQUIRE_THROWS_AS(o.args(), ConstructionError);

  o.message = "tull";
  REQUIRE(o.args() == Args{"commit", "-q", "-m", "tull"});

  o.all = true;
  o.allow_empty = true;
  o.amend = true;
  o.files = {"Makefile", "foo.txt", "bar.txt"};
  REQUIRE(o.args() == Args{"commit", "-q", "-m", "tull", "--all",
                           "--allow-empty", "--amend", "--", "Makefile",
                           "foo.txt", "bar.txt"});

  CommitOptions amend{};
  amend.amend = true;
  REQUIRE(amend.args() == Args{"commit", "-q", "--no-edit", "--amend"});
}

TEST_CASE("fetch arguments") {
  REQUIRE(FetchOptions{}.args() == Args{"fetch", "-q"});

  FetchOptions o{};
  o.prune = true;
  o.tags = true;
  o.remote = "origin";
  o.refspecs = {"main"};
  REQUIRE(o.args() ==
          Args{"fetch", "-q", "--prune", "--tags", "origin", "main"});

  SECTION("all conflicts with a remote") {
    o.all = true;
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
  SECTION("refspecs need a remote") {
    o.remote.reset();
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
  SECTION("all alone") {
    FetchOptions all{};
    all.all = true;
    REQUIRE(all.args() == Args{"fetch", "-q", "--all"});
  }
}

TEST_CASE("init arguments") {
  REQUIRE(InitOptions{}.args() == Args{"init", "-q"});

  InitOptions o{};
  o.bare = true;
  o.initial_branch = "main";
  REQUIRE(o.args() == Args{"init", "-q", "--bare", "--initial-branch=main"});

  o.initial_branch = "";
  REQUIRE_THROWS_AS(o.args(), ConstructionError);
}

TEST_CASE("notes arguments") {
  NotesOptions add{};
  add.message = "test";
  add.object = "HEAD";
  REQUIRE(add.args() == Args{"notes", "add", "-m", "test", "HEAD"});

  add.force = true;
  REQUIRE(add.args() == Args{"notes", "add", "-f", "-m", "test", "HEAD"});

  NotesOptions append{};
  append.action = NotesAction::Append;
  append.message = "test";
  append.object = "HEAD";
  REQUIRE(append.args() == Args{"notes", "append", "-m", "test", "HEAD"});

  NotesOptions rm{};
  rm.action = NotesAction::Remove;
  rm.object = "HEAD";
  REQUIRE(rm.args() == Args{"notes", "remove", "HEAD"});

  SECTION("add without a message") {
    REQUIRE_THROWS_AS(NotesOptions{}.args(), ConstructionError);
  }
  SECTION("remove with a message") {
    rm.message = "x";
    REQUIRE_THROWS_AS(rm.args(), ConstructionError);
  }
  SECTION("force outside add") {
    append.force = true;
    REQUIRE_THROWS_AS(append.args(), ConstructionError);
  }
}

TEST_CASE("pull arguments") {
  REQUIRE(PullOptions{}.args() == Args{"pull", "-q"});

  PullOptions o{};
  o.allow_unrelated = true;
  o.rebase = false;
  o.ff_only = true;
  o.remote = "origin";
  o.refspecs = {"master"};
  REQUIRE(o.args() == Args{"pull", "-q", "--no-rebase", "--ff-only",
                           "--allow-unrelated-histories", "origin", "master"});

  o.remote = "";
  REQUIRE_THROWS_AS(o.args(), ConstructionError);
}

TEST_CASE("push arguments") {
  REQUIRE(PushOptions{}.args() == Args{"push", "-q"});

  PushOptions o{};
  o.force = true;
  o.set_upstream = true;
  o.tags = true;
  o.remote = "origin";
  o.refspecs = {"master"};
  REQUIRE(o.args() == Args{"push", "-q", "--tags", "--force",
                           "--set-upstream", "origin", "master"});

  SECTION("all with refspecs") {
    o.tags = false;
    o.all = true;
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
  SECTION("all with tags") {
    o.refspecs.clear();
    o.all = true;
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
  SECTION("empty remote") {
    o.remote = "";
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
  SECTION("refspec without remote") {
    o.remote.reset();
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
  SECTION("empty refspec") {
    o.refspecs = {""};
    REQUIRE_THROWS_AS(o.args(), ConstructionError);
  }
}

TEST_CASE("remote arguments") {
  RemoteOptions add{RemoteAdd{"origin", "git://myrepo.com", "master", true,
                              false}};
  REQUIRE(add.args() == Args{"remote", "add", "--tags", "-m", "master",
                             "origin", "git://myrepo.com"});

  RemoteOptions rm{RemoteRemove{"origin"}};
  REQUIRE(rm.args() == Args{"remote", "remove", "origin"});

  RemoteOptions mv{RemoteRename{"origin", "upstream"}};
  REQUIRE(mv.args() == Args{"remote", "rename", "origin", "upstream"});

  RemoteOptions set{RemoteSetUrl{"origin", "https://x/y.git"}};
  REQUIRE(set.args() ==
          Args{"remote", "set-url", "origin", "https://x/y.git"});

  SECTION("missing name or url") {
    RemoteOptions no_url{RemoteAdd{"origin", "", std::nullopt, std::nullopt,
                                   false}};
    REQUIRE_THROWS_AS(no_url.args(), ConstructionError);
    RemoteOptions no_name{RemoteRemove{""}};
    REQUIRE_THROWS_AS(no_name.args(), ConstructionError);
  }
}

TEST_CASE("status arguments") {
  REQUIRE(StatusOptions{}.args() ==
          Args{"status", "--porcelain=v2", "--branch", "-z"});

  StatusOptions o{};
  o.untracked = UntrackedMode::All;
  o.ignored = true;
  REQUIRE(o.args() == Args{"status", "--porcelain=v2", "--branch", "-z",
                           "--untracked-files=all", "--ignored"});
}

TEST_CASE("stash arguments") {
  REQUIRE(StashOptions{}.args() == Args{"stash", "push", "-q"});

  StashPush push{};
  push.message = "wip";
  push.include_untracked = true;
  push.pathspecs = {"src"};
  REQUIRE(StashOptions{push}.args() ==
          Args{"stash", "push", "-q", "--include-untracked", "-m", "wip", "--",
               "src"});

  REQUIRE(StashOptions{StashPop{}}.args() == Args{"stash", "pop", "-q"});
  REQUIRE(StashOptions{StashApply{2}}.args() ==
          Args{"stash", "apply", "-q", "stash@{2}"});
  REQUIRE(StashOptions{StashDrop{0}}.args() ==
          Args{"stash", "drop", "-q", "stash@{0}"});
  REQUIRE(StashOptions{StashClear{}}.args() == Args{"stash", "clear"});

  REQUIRE_THROWS_AS(StashOptions{StashPop{-1}}.args(), ConstructionError);
}

TEST_CASE("tag arguments") {
  TagOptions create{TagCreate{"v1.0", "testen", "HEAD", false}};
  REQUIRE(create.args() ==
          Args{"tag", "-a", "-m", "testen", "v1.0", "HEAD"});

  TagOptions light{TagCreate{"v1.0", std::nullopt, std::nullopt, true}};
  REQUIRE(light.args() == Args{"tag", "-f", "v1.0"});

  TagOptions del{TagDelete{{"v1.0"}}};
  REQUIRE(del.args() == Args{"tag", "-d", "v1.0"});

  REQUIRE_THROWS_AS(TagOptions{TagDelete{}}.args(), ConstructionError);
  REQUIRE_THROWS_AS(TagOptions{TagCreate{}}.args(), ConstructionError);
}

TEST_CASE("building twice gives the same arguments") {
  PushOptions o{};
  o.remote = "origin";
  o.refspecs = {"main"};
  auto first = o.args();
  REQUIRE(o.args() == first);
}
