// =============================================================================
// lambdalang - Main Entry Point
// =============================================================================

#include <iostream>

#include "lambdalang/cli.hpp"

int main(int argc, char* argv[]) {
    return lambdalang::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
