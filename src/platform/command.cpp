#include "platform/command.hpp"

#include <glibmm.h>

#include <iostream>
#include <sys/wait.h>

bool command::run_capture(const std::vector<std::string>& argv, std::string& output,
                          std::string* error_output) {
    if (argv.empty()) {
        return false;
    }

    std::string standard_error;
    int wait_status = 0;
    try {
        Glib::spawn_sync("", argv, Glib::SpawnFlags::SEARCH_PATH, {}, &output, &standard_error,
                         &wait_status);
    } catch (const Glib::SpawnError& e) {
        std::cerr << "Failed to run " << argv.front() << ": " << e.what() << '\n';
        if (error_output) {
            *error_output = e.what();
        }
        return false;
    }

    if (error_output) {
        *error_output = standard_error;
    }
    return WIFEXITED(wait_status) && WEXITSTATUS(wait_status) == 0;
}

std::string command::find_program(const std::string& program) {
    if (program.empty()) {
        return "";
    }
    return Glib::find_program_in_path(program);
}

