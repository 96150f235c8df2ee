#include <gitcmd/config.hpp>

#include <cstdlib>
#include <string_view>

namespace gitcmd {

static bool env_true(const char *v) {
  std::string_view s(v);
  return s == "1" || s == "true" || s == "yes" || s == "on";
}

Config Config::from_env() {
  Config c{};
  if (const char *bin = ::getenv("GITCMD_GIT")) {
    if (*bin)
      c.git_binary = bin;
  }
  if (const char *p = ::getenv("GITCMD_TERMINAL_PROMPT"))
    c.terminal_prompt = env_true(p);
  return c;
}

} // namespace gitcmd
