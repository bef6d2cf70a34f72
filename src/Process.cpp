#include "reelify/Process.h"

#include <array>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/wait.h>

namespace reelify {

std::string quote(const std::string& s) {
  std::ostringstream oss;
  oss << '"';
  for (char c : s) {
    if (c == '"' || c == '\\' || c == '$' || c == '`') oss << '\\';
    oss << c;
  }
  oss << '"';
  return oss.str();
}

int runCommand(const std::string& cmd, std::string& output) {
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) return -1;

  std::array<char, 4096> buffer{};
  size_t n = 0;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    output.append(buffer.data(), n);
  }

  const int status = pclose(pipe);
  if (status == -1) return -1;
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

std::string readFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

} // namespace reelify
