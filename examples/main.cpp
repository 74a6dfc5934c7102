#include <syllog/app/cli.hpp>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char **argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    return syllog::app::run_cli(args, std::cin, std::cout, std::cerr);
}
