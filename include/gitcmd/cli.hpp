#pragma once
#include <gitcmd/commands.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace gitcmd {

struct CmdStatus {
  StatusOptions opts;
  bool json = false;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<InitOptions, CloneOptions, AddOptions, CommitOptions,
                 FetchOptions, PullOptions, PushOptions, RemoteOptions,
                 CmdStatus, StashOptions, TagOptions, NotesOptions, CmdHelp,
                 CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;

  // global options
  std::filesystem::path dir = ".";
  bool verbose = false;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace gitcmd
