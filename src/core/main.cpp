#include <iostream>
#include <string>
#include <vector>

#include "core/cli.hpp"

int main(int argc, char **argv) {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? static_cast<size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  return osmpbf_cli::run(args, std::cout, std::cerr);
}
