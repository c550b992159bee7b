#include <iostream>
#include <string>
#include <vector>

#include "Cli/CommandLine.h"

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return runCommandLine(args, std::cout, std::cerr);
}
