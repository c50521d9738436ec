#include "core/Application.h"
#include <iostream>

int main(int argc, char** argv) {
    inviscan::Application app(std::cout);
    return app.run(argc, argv);
}
