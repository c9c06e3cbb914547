#include "AnonymizationPipeline.h"
#include "ObscuraExceptions.h"
#include "RunConfig.h"

#include <iostream>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "obscura";

    RunConfig config;
    try {
        config = RunConfig::fromArgs(argc, argv);
    } catch (const Obscura::ObscuraException& e) {
        std::cerr << "[Obscura][Error] " << e.what() << "\n";
        if (argc >= 2) std::cerr << RunConfig::usage(program);
        return 1;
    }

    if (config.showHelp) {
        std::cout << RunConfig::usage(program);
        return 0;
    }

    try {
        AnonymizationPipeline pipeline;
        return pipeline.run(config);
    } catch (const Obscura::ObscuraException& e) {
        std::cerr << "[Obscura][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Obscura][Exception] " << e.what() << "\n";
        return 1;
    }
}
