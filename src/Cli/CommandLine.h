#pragma once

#include <ostream>
#include <string>
#include <vector>

// Runs the command line (arguments without the program name), writing
// per-edit results to out and diagnostics to err.
// Exit codes: 0 every edit applied, 1 some edit failed, 2 usage error.
int runCommandLine(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
