#pragma once

#include <ostream>
#include <string>
#include <vector>

// petal build <wordlist> <image>
// petal check <image> <word>...
//
// args excludes the program name. Returns the process exit status:
// 0 ok, 1 on a library or I/O error, 2 on bad usage.
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
