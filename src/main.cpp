#include "FlarePipeline.h"
#include "FlarejoinExceptions.h"
#include "PipelineConfig.h"

#include <exception>
#include <iostream>
#include <utility>

int main(int argc, char* argv[]) {
    try {
        PipelineConfig config = PipelineConfig::fromArgs(argc, argv);
        if (config.showHelp) {
            std::cout << PipelineConfig::usage(argc > 0 ? argv[0] : "flarejoin");
            return 0;
        }
        FlarePipeline pipeline(std::move(config));
        return pipeline.run();
    } catch (const Flarejoin::FlarejoinException& e) {
        std::cerr << "[Flarejoin Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Flarejoin Exception] " << e.what() << "\n";
        return 1;
    }
}
