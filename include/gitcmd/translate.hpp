#pragma once
#include <gitcmd/process.hpp>
#include <gitcmd/status.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace gitcmd {

// Throws NotARepository or ExecutionError for a non-zero exit.
// stderr and the exit code are passed through untouched.
void check_exit(const std::string &command, const std::filesystem::path &cwd,
                const ProcessOutput &out);

// Output of `git status --porcelain=v2 --branch -z`. Throws ParseError.
Status parse_status(std::string_view out);

} // namespace gitcmd
