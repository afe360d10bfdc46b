#include <iostream>

#include "srelvis/cli.hpp"

int main(int argc, char** argv) { return srelvis::cli::run(argc, argv, std::cout, std::cerr); }
