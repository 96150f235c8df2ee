#pragma once

namespace gitcmd {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace gitcmd
