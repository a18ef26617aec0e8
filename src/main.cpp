#include "cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args;
    if (argc > 1) args.assign(argv + 1, argv + argc);
    return run_cli(args, std::cout, std::cerr);
}
