// src/native/fusion/main.cpp
#include "include/fuse-cli.h"
#include "include/utils.h"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        auto options = Utils::Args::parse_arguments(argc, argv);
        return run_cli(options);

    } catch (const Fusion::InvalidInputError& e) {
        std::cerr << "❌ Invalid input: " << e.what() << std::endl;
        return 1;
    } catch (const Fusion::ProviderError& e) {
        std::cerr << "❌ Cannot read model output: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }
}
