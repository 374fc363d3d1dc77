#include "galley/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        galley::startup_config cfg{};
        if (auto cli_result = galley::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return galley::cli::run(cfg);
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
