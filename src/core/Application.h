#pragma once
#include <ostream>

namespace inviscan {

// Wires argument parsing, file collection, scanning and rendering together.
// Returns the process exit code (0 clean, 1 threat, 2 operational error).
class Application {
public:
    explicit Application(std::ostream& out) : out_(out) {}

    int run(int argc, char** argv);

private:
    std::ostream& out_;
};

}
