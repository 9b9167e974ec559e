#pragma once

namespace carryover::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace carryover::cli
