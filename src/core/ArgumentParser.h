#pragma once
#include "Config.h"
#include <ostream>

namespace inviscan {

class ArgumentParser {
public:
    // Returns false when the program should exit right away (help, version
    // or a usage error); exit_code() then tells which.
    bool parse(int argc, char** argv, Config& cfg);
    int exit_code() const { return exit_code_; }

    static void print_help(std::ostream& os);
    static void print_version(std::ostream& os);

private:
    int exit_code_ = 0;
};

}
