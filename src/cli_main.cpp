/// @file
/// @brief CLI entry point for the combination guess ranker.

#include <cstdio>

#include "cli/cli_options.h"

int main(int argc, char* argv[]) {
  return combomatic::runCli(argc, argv, stdout, stderr);
}
