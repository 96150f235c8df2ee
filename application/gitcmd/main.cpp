#include <gitcmd/app.hpp>

int main(int argc, char **argv) { return gitcmd::App{}.run(argc, argv); }
