#include "cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        auto config = webpify::CLI::parse(argc, argv);
        if (!config) {
            return static_cast<int>(webpify::ExitCode::Failure);
        }

        return webpify::CLI::run(*config);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return static_cast<int>(webpify::ExitCode::Failure);
    }
}
