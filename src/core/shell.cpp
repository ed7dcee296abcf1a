#include <voxturn/core/shell.hpp>

#include <cstdlib>

#include <sys/wait.h>

namespace voxturn {

std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') out += "'\\''";
    else out += c;
  }
  out += "'";
  return out;
}

int runShell(const std::string& cmd) {
  int ret = std::system(cmd.c_str());
  if (ret == -1) return -1;
  if (WIFEXITED(ret)) return WEXITSTATUS(ret);
  return -1;
}

} // namespace voxturn
