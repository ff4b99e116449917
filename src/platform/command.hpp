#ifndef PLATFORM_COMMAND_HPP
#define PLATFORM_COMMAND_HPP

#include <string>
#include <vector>

namespace command {
// Runs argv to completion and captures stdout. Returns false when the program
// cannot be spawned or exits with a non-zero status; stderr is stored in error_output.
bool run_capture(const std::vector<std::string>& argv, std::string& output,
                 std::string* error_output = nullptr);

// Absolute path of program on PATH, or an empty string.
std::string find_program(const std::string& program);
}

#endif
