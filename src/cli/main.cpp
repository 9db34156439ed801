// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file main.cpp
 * @brief webhdfs_cli entry point
 */

#include "kcenon/webhdfs/cli/command_line.h"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::ios::sync_with_stdio(false);

    std::vector<std::string> args(argv + 1, argv + argc);
    kcenon::webhdfs::cli::console io{std::cin, std::cout, std::cerr};
    return kcenon::webhdfs::cli::run_cli(args, kcenon::webhdfs::cli::process_environment(), io);
}
