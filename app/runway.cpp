#include "runway/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        runway::startup_config cfg{};
        if (auto cli_result = runway::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        auto process = runway::process_config::from_environment();
        return runway::cli::run(cfg, process);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
