#pragma once
#include <iostream>
#include <ostream>

namespace devkit::cli {

// Output sinks handed to the dispatcher and to every command. Nothing in
// the cli layer writes to std::cout/std::cerr directly.
struct Console {
    std::ostream& out;
    std::ostream& err;

    static Console standard() { return Console{std::cout, std::cerr}; }
};

}  // namespace devkit::cli
