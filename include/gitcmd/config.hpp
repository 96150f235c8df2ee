#pragma once
#include <string>
#include <unordered_map>

namespace gitcmd {

struct Config {
  std::string git_binary = "git";

  // false: child gets GIT_TERMINAL_PROMPT=0 and fails instead of prompting
  bool terminal_prompt = false;

  std::unordered_map<std::string, std::string> env;

  // GITCMD_GIT, GITCMD_TERMINAL_PROMPT
  static Config from_env();
};

} // namespace gitcmd
