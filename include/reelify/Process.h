// Reelify - Process helpers
// Shell out to external tools and capture what they print.

#pragma once

#include <string>

namespace reelify {

// Wraps `s` in double quotes, escaping embedded quotes and backslashes.
std::string quote(const std::string& s);

// Runs `cmd` through the shell and appends its stdout to `output`.
// Returns the exit code, or -1 if the process could not be started.
int runCommand(const std::string& cmd, std::string& output);

// Whole contents of `path`; empty when the file cannot be read.
std::string readFile(const std::string& path);

} // namespace reelify
