#pragma once

#include <string>

namespace voxturn {

// Wraps s in single quotes for /bin/sh.
std::string shellQuote(const std::string& s);

// Runs cmd through std::system. Returns the exit status, or -1 when the
// shell could not be started or the child was killed by a signal.
int runShell(const std::string& cmd);

} // namespace voxturn
